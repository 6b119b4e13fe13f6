#include "rallycode/notation/encode.hpp"


namespace rallycode::notation {

std::string encode(const schema::Shot& shot) {
    std::string out;
    out.push_back(to_char(shot.type));
    if (shot.position != Position::None) {
        out.push_back(to_char(shot.position));
    }
    if (shot.net_cord) {
        out.push_back(NET_CORD);
    }
    if (shot.stop_volley) {
        out.push_back(STOP_VOLLEY);
    }
    if (shot.direction != ShotDirection::Unknown) {
        out.push_back(to_char(shot.direction));
    }
    if (shot.depth != Depth::None) {
        out.push_back(to_char(shot.depth));
    }
    if (shot.error != ErrorKind::None) {
        out.push_back(to_char(shot.error));
    }
    if (shot.outcome != ShotOutcome::InPlay) {
        out.push_back(to_char(shot.outcome));
    }
    return out;
}

std::string encode(const schema::Rally& rally) {
    std::string out;
    for (const auto& s : rally.shots) {
        out += encode(s);
    }
    return out;
}

std::string encode(const schema::Serve& serve) {
    std::string out(serve.lets, LET);
    out.push_back(to_char(serve.direction));
    if (serve.serve_and_volley) {
        out.push_back(SERVE_AND_VOLLEY);
    }
    switch (serve.outcome) {
        case ServeOutcome::Fault:
            out.push_back(to_char(serve.fault));
            break;
        case ServeOutcome::Ace:
        case ServeOutcome::Unreturnable:
            out.push_back(to_char(serve.outcome));
            break;
        default:
            break;
    }
    return out;
}

PointCodes encode(const schema::ShotSequence& seq) {
    PointCodes codes;
    switch (seq.shape) {
        case schema::PointShape::NotCoded:
            codes.first = seq.server_won ? "S" : "R";
            return codes;
        case schema::PointShape::ServerLostOutright:
            codes.first = "P";
            return codes;
        case schema::PointShape::ServerWonOutright:
            codes.first = "Q";
            return codes;
        case schema::PointShape::Coded:
            break;
    }

    if (seq.first_serve) {
        codes.first = encode(*seq.first_serve);
    }
    if (seq.second_serve) {
        codes.second = encode(*seq.second_serve);
    }
    if (seq.rally) {
        (seq.second_serve ? codes.second : codes.first) += encode(*seq.rally);
    }
    return codes;
}

} // namespace rallycode::notation
