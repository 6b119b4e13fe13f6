#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

#include "rallycode/notation/schema/serve.hpp"
#include "rallycode/notation/schema/rally.hpp"
#include "rallycode/notation/result.hpp"
#include "rallycode/notation/error.hpp"


namespace rallycode::notation::schema {

// ===============================================================
// POINT SHAPE
// ===============================================================
enum class PointShape : uint8_t {
    NotCoded,               // S / R: winner known, no shot detail
    ServerLostOutright,     // P
    ServerWonOutright,      // Q
    Coded                   // first serve always present
};

[[nodiscard]] inline constexpr std::string_view to_string(PointShape s) noexcept {
    switch (s) {
        case PointShape::NotCoded:           return "not_coded";
        case PointShape::ServerLostOutright: return "server_lost_outright";
        case PointShape::ServerWonOutright:  return "server_won_outright";
        case PointShape::Coded:              return "coded";
    }
    return "unknown";
}

/*
===============================================================================
ShotSequence
===============================================================================

The decoded narrative of one point: who served, who returned, who won, and
exactly one of four shapes.

For Coded points:
  • first_serve is always present
  • second_serve is present iff the first serve was a fault
  • rally is present iff the terminating serve was returned in play

The shortcut shapes carry no serve or rally.

Values are immutable once built. Build them through the decoder
(parser::shot_sequence) or through the factories below; assemble() verifies
the Coded invariants on hand-built parts.
===============================================================================
*/

struct ShotSequence {
    std::string server;
    std::string returner;
    bool server_won{false};
    PointShape shape{PointShape::Coded};

    std::optional<Serve> first_serve;
    std::optional<Serve> second_serve;
    std::optional<Rally> rally;

    [[nodiscard]] bool not_coded() const noexcept { return shape == PointShape::NotCoded; }
    [[nodiscard]] bool server_lost_outright() const noexcept { return shape == PointShape::ServerLostOutright; }
    [[nodiscard]] bool server_won_outright() const noexcept { return shape == PointShape::ServerWonOutright; }
    [[nodiscard]] bool is_coded() const noexcept { return shape == PointShape::Coded; }

    // The serve that ended the serving phase (second serve if the first
    // faulted). Null for shortcut shapes.
    [[nodiscard]] const Serve* terminating_serve() const noexcept;

    // Shot count including serves; 0 for shortcut shapes.
    [[nodiscard]] std::size_t shot_count() const noexcept;

    // Verifies the shape rules above, reporting the first violation.
    [[nodiscard]] Result check(Error& err) const;

    [[nodiscard]] bool invariants_hold() const;

    // Serves then rally shots, one per line, in the order they happened.
    void print_sequence(std::ostream& os) const;

    void dump(std::ostream& os) const;

    bool operator==(const ShotSequence&) const = default;

    // ------------------------------------------------------------
    // Factories
    // ------------------------------------------------------------
    [[nodiscard]]
    static ShotSequence not_coded_point(std::string_view server, std::string_view returner, bool server_won);

    [[nodiscard]]
    static ShotSequence lost_outright_point(std::string_view server, std::string_view returner, bool server_won);

    [[nodiscard]]
    static ShotSequence won_outright_point(std::string_view server, std::string_view returner, bool server_won);

    [[nodiscard]]
    static Result assemble(std::string_view server, std::string_view returner, bool server_won,
                           Serve first, std::optional<Serve> second, std::optional<Rally> rally,
                           ShotSequence& out, Error& err);
};

std::ostream& operator<<(std::ostream& os, const ShotSequence& s);

} // namespace rallycode::notation::schema
