#include "rallycode/notation/schema/shot_sequence.hpp"

#include <ostream>
#include <utility>


namespace rallycode::notation::schema {

namespace {

ShotSequence shortcut(std::string_view server, std::string_view returner, bool server_won, PointShape shape) {
    ShotSequence s;
    s.server.assign(server);
    s.returner.assign(returner);
    s.server_won = server_won;
    s.shape = shape;
    return s;
}

} // namespace

// ---------------------------------
// Factories
// ---------------------------------

ShotSequence ShotSequence::not_coded_point(std::string_view server, std::string_view returner, bool server_won) {
    return shortcut(server, returner, server_won, PointShape::NotCoded);
}

ShotSequence ShotSequence::lost_outright_point(std::string_view server, std::string_view returner, bool server_won) {
    return shortcut(server, returner, server_won, PointShape::ServerLostOutright);
}

ShotSequence ShotSequence::won_outright_point(std::string_view server, std::string_view returner, bool server_won) {
    return shortcut(server, returner, server_won, PointShape::ServerWonOutright);
}

Result ShotSequence::assemble(std::string_view server, std::string_view returner, bool server_won,
                              Serve first, std::optional<Serve> second, std::optional<Rally> rally,
                              ShotSequence& out, Error& err) {
    ShotSequence s;
    s.server.assign(server);
    s.returner.assign(returner);
    s.server_won = server_won;
    s.shape = PointShape::Coded;
    s.first_serve = std::move(first);
    s.second_serve = std::move(second);
    s.rally = std::move(rally);

    auto r = s.check(err);
    if (r != Result::Parsed) {
        return r;
    }
    out = std::move(s);
    return Result::Parsed;
}

// ---------------------------------
// Queries
// ---------------------------------

const Serve* ShotSequence::terminating_serve() const noexcept {
    if (second_serve) {
        return &*second_serve;
    }
    if (first_serve) {
        return &*first_serve;
    }
    return nullptr;
}

std::size_t ShotSequence::shot_count() const noexcept {
    std::size_t n = 0;
    if (first_serve) ++n;
    if (second_serve) ++n;
    if (rally) n += rally->size();
    return n;
}

bool ShotSequence::invariants_hold() const {
    Error ignored;
    return check(ignored) == Result::Parsed;
}

Result ShotSequence::check(Error& err) const {
    const std::string_view raw = first_serve ? std::string_view(first_serve->raw_code) : std::string_view{};

    switch (shape) {
        case PointShape::NotCoded:
        case PointShape::ServerLostOutright:
        case PointShape::ServerWonOutright:
            if (first_serve || second_serve || rally) {
                return err.set(Result::MalformedSequence, to_string(shape), raw, "shortcut point carries serve or rally detail");
            }
            return Result::Parsed;
        case PointShape::Coded:
            break;
    }

    if (!first_serve) {
        return err.set(Result::MissingRequiredServe, {}, {}, "coded point without a first serve");
    }
    if (!first_serve->is_first()) {
        return err.set(Result::MalformedSequence, first_serve->raw_code, raw, "first serve is marked as a second serve");
    }
    if (first_serve->was_fault() && !second_serve) {
        return err.set(Result::MissingRequiredServe, first_serve->raw_code, raw, "first serve faulted but no second serve is present");
    }
    if (!first_serve->was_fault() && second_serve) {
        return err.set(Result::MalformedSequence, second_serve->raw_code, raw, "second serve present although the first serve was in");
    }
    if (second_serve && second_serve->is_first()) {
        return err.set(Result::MalformedSequence, second_serve->raw_code, raw, "second serve is marked as a first serve");
    }

    const Serve* last = terminating_serve();
    if (last->had_rally() && !rally) {
        return err.set(Result::MalformedSequence, last->raw_code, raw, "serve returned in play but no rally is present");
    }
    if (!last->had_rally() && rally) {
        return err.set(Result::MalformedSequence, last->raw_code, raw, "rally present after a serve that ended the point");
    }
    if (rally) {
        if (rally->empty()) {
            return err.set(Result::MalformedSequence, last->raw_code, raw, "rally is empty");
        }
        for (std::size_t i = 0; i + 1 < rally->size(); ++i) {
            if (rally->shots[i].is_terminal()) {
                return err.set(Result::MalformedSequence, last->raw_code, raw, "terminal outcome before the end of the rally");
            }
        }
    }
    return Result::Parsed;
}

// ---------------------------------
// Debug / logging helpers
// ---------------------------------

void ShotSequence::print_sequence(std::ostream& os) const {
    if (first_serve) {
        os << *first_serve << '\n';
    }
    if (second_serve) {
        os << *second_serve << '\n';
    }
    if (rally) {
        for (const auto& shot : rally->shots) {
            os << shot << '\n';
        }
    }
}

void ShotSequence::dump(std::ostream& os) const {
    os << "[POINT] { "
       << "server=" << server << ", "
       << "returner=" << returner << ", "
       << "winner=" << (server_won ? server : returner) << ", "
       << "shape=" << to_string(shape);
    if (is_coded()) {
        os << ", serves=" << (second_serve ? 2 : 1)
           << ", rally=" << (rally ? rally->size() : 0);
    }
    os << " }";
}

std::ostream& operator<<(std::ostream& os, const ShotSequence& s) {
    s.dump(os);
    return os;
}

} // namespace rallycode::notation::schema
