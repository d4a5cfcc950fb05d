#include "opr_core/match_csv.hpp"

#include <cmath>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

namespace opr_core {

namespace {

constexpr std::size_t kColumns = 8;

std::string trim(const std::string &s) {
  const auto first = s.find_first_not_of(" \t\r");
  if (first == std::string::npos)
    return {};
  const auto last = s.find_last_not_of(" \t\r");
  return s.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string &line) {
  std::vector<std::string> cells;
  std::stringstream ss(line);
  std::string cell;
  while (std::getline(ss, cell, ','))
    cells.push_back(trim(cell));
  return cells;
}

TeamId to_team(const std::string &cell, int line_no) {
  std::size_t used = 0;
  long long v = 0;
  try {
    v = std::stoll(cell, &used);
  } catch (const std::exception &) {
    used = 0;
  }
  if (used == 0 || used != cell.size()) {
    throw std::runtime_error(
        fmt::format("line {}: bad team number '{}'", line_no, cell));
  }
  return static_cast<TeamId>(v);
}

double to_points(const std::string &cell, int line_no) {
  std::size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(cell, &used);
  } catch (const std::exception &) {
    used = 0;
  }
  if (used == 0 || used != cell.size() || !std::isfinite(v)) {
    throw std::runtime_error(
        fmt::format("line {}: bad point value '{}'", line_no, cell));
  }
  return v;
}

} // namespace

MatchSet parse_matches_csv(std::istream &in) {
  MatchSet set;
  std::string line;
  int line_no = 0;
  bool header = true;
  while (std::getline(in, line)) {
    ++line_no;
    if (trim(line).empty())
      continue;
    if (header) {
      header = false;
      continue;
    }
    const auto cells = split(line);
    if (cells.size() != kColumns) {
      throw std::runtime_error(fmt::format(
          "line {}: expected {} columns, got {}", line_no, kColumns,
          cells.size()));
    }
    set.matches.emplace_back(
        std::vector<TeamId>{to_team(cells[0], line_no),
                            to_team(cells[1], line_no)},
        std::vector<TeamId>{to_team(cells[2], line_no),
                            to_team(cells[3], line_no)},
        to_points(cells[4], line_no), to_points(cells[5], line_no),
        to_points(cells[6], line_no), to_points(cells[7], line_no));
  }
  set.teams = teams_in(set.matches);
  return set;
}

MatchSet read_matches_csv(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw std::runtime_error(fmt::format("cannot open {}", path));
  return parse_matches_csv(in);
}

} // namespace opr_core
