// ============================================================================
// decode_points
//
// Decodes a JSON file of charted points, optionally prints every point shot
// by shot, and reports the batch statistics and a chart summary.
//
//   decode_points -i examples/data/sample_points.json -p -w 4
// ============================================================================

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "common/cli/decode_params.hpp"
#include "rallycode.hpp"


int main(int argc, char** argv) {
    using namespace rallycode;

    const auto params = examples::cli::decode::configure(argc, argv, "Decode charted tennis points");
    params.dump("=== decode_points ===", std::cout);

    std::ifstream in(params.input, std::ios::binary);
    if (!in) {
        RC_ERROR("Cannot open '" << params.input << "'");
        return 1;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const std::string json = buffer.str();

    charting::BatchDecoder decoder(params.workers);
    std::vector<charting::DecodedPoint> points;
    const auto r = decoder.decode_json(json, points);
    if (r != charting::parser::Result::Parsed) {
        RC_ERROR("Unusable input document (" << charting::parser::to_string(r) << ")");
        return 1;
    }

    stats::Summary summary;
    for (const auto& p : points) {
        summary.add(p.sequence);
        if (params.print) {
            std::cout << "\n#" << p.row << ' ' << p.sequence << '\n';
            p.sequence.print_sequence(std::cout);
        }
    }

    std::cout << '\n' << decoder.stats() << '\n' << summary;
    return 0;
}
