#include "io/fixtures.h"

#include "error.h"

#include <algorithm>
#include <fstream>
#include <istream>
#include <sstream>

namespace rings {

namespace {

/// Calls f(line_number, tokens) for every data line.  Commas count as
/// whitespace.
template <typename F>
void for_each_data_line(std::istream& in, F&& f) {
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        std::replace(line.begin(), line.end(), ',', ' ');
        std::istringstream fields(line);
        std::vector<std::string> tokens;
        for (std::string t; fields >> t; ) tokens.push_back(std::move(t));
        if (tokens.empty() || tokens.front().front() == '#') continue;
        f(line_number, tokens);
    }
}

[[noreturn]] void malformed(std::size_t line_number, const std::string& what) {
    throw ConfigurationError("line " + std::to_string(line_number) + ": " + what);
}

NodeId parse_node(std::size_t line_number, const std::string& token) {
    std::size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(token, &used);
    } catch (const std::logic_error&) {
        malformed(line_number, "bad node id '" + token + "'");
    }
    if (used != token.size() || token.front() == '-') {
        malformed(line_number, "bad node id '" + token + "'");
    }
    return static_cast<NodeId>(value);
}

double parse_real(std::size_t line_number, const std::string& token) {
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(token, &used);
    } catch (const std::logic_error&) {
        malformed(line_number, "bad coordinate '" + token + "'");
    }
    if (used != token.size()) {
        malformed(line_number, "bad coordinate '" + token + "'");
    }
    return value;
}

std::ifstream open_fixture(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot open " + path);
    return in;
}

} // namespace

// ── Edges ───────────────────────────────────────────────────────────

std::vector<Edge> read_edge_list(std::istream& in) {
    std::vector<Edge> edges;
    for_each_data_line(in, [&](std::size_t ln, const std::vector<std::string>& t) {
        if (t.size() != 2) malformed(ln, "expected 2 node ids");
        const NodeId u = parse_node(ln, t[0]);
        const NodeId v = parse_node(ln, t[1]);
        if (u == v) malformed(ln, "self-loop on node " + t[0]);
        edges.emplace_back(u, v);
    });
    return edges;
}

std::vector<Edge> read_edge_list(const std::string& path) {
    auto in = open_fixture(path);
    return read_edge_list(in);
}

// ── Coordinates ─────────────────────────────────────────────────────

CoordMap read_coordinates(std::istream& in) {
    CoordMap coords;
    NodeId next_id = 0;
    for_each_data_line(in, [&](std::size_t ln, const std::vector<std::string>& t) {
        NodeId id = next_id++;
        std::size_t first = 0;
        if (t.size() == 3) {
            id = parse_node(ln, t[0]);
            first = 1;
        } else if (t.size() != 2) {
            malformed(ln, "expected 'x y' or 'id, x, y'");
        }
        const Vec2 p{parse_real(ln, t[first]), parse_real(ln, t[first + 1])};
        if (!coords.emplace(id, p).second) {
            malformed(ln, "duplicate coordinate for node " + std::to_string(id));
        }
    });
    return coords;
}

CoordMap read_coordinates(const std::string& path) {
    auto in = open_fixture(path);
    return read_coordinates(in);
}

// ── Rings ───────────────────────────────────────────────────────────

std::vector<std::vector<NodeId>> read_rings(std::istream& in) {
    std::vector<std::vector<NodeId>> rings;
    for_each_data_line(in, [&](std::size_t ln, const std::vector<std::string>& t) {
        std::vector<NodeId> ring;
        ring.reserve(t.size());
        for (const auto& token : t) ring.push_back(parse_node(ln, token));
        rings.push_back(std::move(ring));
    });
    return rings;
}

std::vector<std::vector<NodeId>> read_rings(const std::string& path) {
    auto in = open_fixture(path);
    return read_rings(in);
}

} // namespace rings
