#include "tile_csp/tiling/parser.hpp"
#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace tile_csp {
namespace tiling {

namespace {

[[noreturn]] void parse_error(size_t line_no, const std::string& message) {
    throw std::runtime_error("Parse error: line " + std::to_string(line_no) + ": " + message);
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

int64_t parse_int(const std::string& text, size_t line_no, const std::string& what) {
    auto s = trim(text);
    size_t pos = 0;
    int64_t value = 0;
    try {
        value = std::stoll(s, &pos);
    } catch (const std::invalid_argument&) {
        parse_error(line_no, "invalid " + what + " '" + s + "'");
    } catch (const std::out_of_range&) {
        parse_error(line_no, what + " out of range '" + s + "'");
    }
    if (pos != s.size()) {
        parse_error(line_no, "invalid " + what + " '" + s + "'");
    }
    return value;
}

// 色の値域チェック（0..NUM_COLORS の判定は Landscape / validate_problem が行う）
Landscape::Color parse_color(const std::string& text, size_t line_no, const std::string& what) {
    auto value = parse_int(text, line_no, what);
    if (value < std::numeric_limits<Landscape::Color>::min() ||
        value > std::numeric_limits<Landscape::Color>::max()) {
        parse_error(line_no, what + " out of range '" + trim(text) + "'");
    }
    return static_cast<Landscape::Color>(value);
}

std::vector<Landscape::Color> parse_row(const std::string& line, size_t line_no) {
    std::vector<Landscape::Color> row;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        row.push_back(parse_color(token, line_no, "landscape cell"));
    }
    return row;
}

// {FULL_BLOCK=X,OUTER_BOUNDARY=Y,EL_SHAPE=Z}（省略したキーは 0）
Inventory parse_inventory(const std::string& line, size_t line_no) {
    if (line.back() != '}') {
        parse_error(line_no, "tile counts must end with '}'");
    }
    Inventory inventory;
    std::istringstream iss(line.substr(1, line.size() - 2));
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (trim(item).empty()) {
            continue;
        }
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            parse_error(line_no, "expected KEY=COUNT in tile counts, got '" + trim(item) + "'");
        }
        auto key = trim(item.substr(0, eq));
        auto count = parse_int(item.substr(eq + 1), line_no, "tile count");

        bool known = false;
        for (size_t s = 0; s < NUM_SHAPES; ++s) {
            auto shape = static_cast<TileShape>(s);
            if (key == shape_key(shape)) {
                inventory.set(shape, count);
                known = true;
                break;
            }
        }
        if (!known) {
            parse_error(line_no, "unknown tile shape '" + key + "'");
        }
    }
    return inventory;
}

} // namespace

std::unique_ptr<TilingProblem> parse_stream(std::istream& in) {
    auto problem = std::make_unique<TilingProblem>();

    enum class Section { Landscape, Targets };
    Section section = Section::Landscape;
    std::vector<std::vector<Landscape::Color>> rows;

    std::string raw;
    size_t line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        auto line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (section == Section::Landscape) {
            if (line[0] == '{') {
                problem->inventory = parse_inventory(line, line_no);
                section = Section::Targets;
            } else {
                rows.push_back(parse_row(line, line_no));
            }
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            parse_error(line_no, "expected COLOR:COUNT, got '" + line + "'");
        }
        auto color = parse_color(line.substr(0, colon), line_no, "color");
        auto count = parse_int(line.substr(colon + 1), line_no, "target count");
        problem->target[color] = count;
    }

    if (rows.empty()) {
        throw std::runtime_error("Parse error: no landscape data found");
    }

    // 短い行は 0（茂みなし）で埋める
    size_t width = 0;
    for (const auto& row : rows) {
        width = std::max(width, row.size());
    }
    for (auto& row : rows) {
        row.resize(width, Landscape::NONE);
    }
    problem->landscape = Landscape::from_rows(rows);

    return problem;
}

std::unique_ptr<TilingProblem> parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    return parse_stream(file);
}

std::unique_ptr<TilingProblem> parse_string(const std::string& input) {
    std::istringstream iss(input);
    return parse_stream(iss);
}

} // namespace tiling
} // namespace tile_csp
