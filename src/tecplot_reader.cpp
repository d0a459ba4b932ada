#include "tecplot_reader.h"

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include "string_utils.h"

namespace {

std::vector<std::string> ExtractQuotedNames(const std::string& line) {
  std::vector<std::string> names;
  size_t pos = 0;
  while (true) {
    const size_t open = line.find('"', pos);
    if (open == std::string::npos) break;
    const size_t close = line.find('"', open + 1);
    if (close == std::string::npos) break;
    names.push_back(line.substr(open + 1, close - open - 1));
    pos = close + 1;
  }
  return names;
}

bool MatchesSynonym(const std::string& key, const ColumnSynonym& rule) {
  for (const auto& name : rule.exact) {
    if (key == name) {
      return true;
    }
  }
  return !rule.stem.empty() && key.find(rule.stem) != std::string::npos;
}

bool ParseNumericRow(const std::vector<std::string>& tokens, std::vector<double>* row) {
  row->clear();
  row->reserve(tokens.size());
  for (const auto& token : tokens) {
    double value = 0.0;
    if (!prtcal::ParseDouble(token, &value)) {
      return false;
    }
    row->push_back(value);
  }
  return true;
}

TableReadResult Unparseable(TableReadResult result, const std::string& error) {
  result.ok = false;
  result.error = error;
  return result;
}

}  // namespace

int ResultTable::FindColumn(const std::string& name) const {
  for (size_t i = 0; i < names.size(); ++i) {
    if (names[i] == name) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

const std::vector<double>& ResultTable::Column(const std::string& name) const {
  const int index = FindColumn(name);
  if (index < 0) {
    throw std::out_of_range("missing column: " + name);
  }
  return columns[static_cast<size_t>(index)];
}

std::string ColumnKey(const std::string& name) {
  std::string key;
  for (char c : prtcal::ToLower(prtcal::Trim(name))) {
    if (c == '_' || c == '-' || c == '.' || c == ' ') {
      continue;
    }
    key.push_back(c);
  }
  return key;
}

// Vector components are matched whole so Velocity_y or Momentum_z never
// claim an x-component name.
const std::vector<ColumnSynonym>& DefaultColumnSynonyms() {
  static const std::vector<ColumnSynonym> synonyms = {
      {column::kX, {"x", "coordinatex", "coordx"}, ""},
      {column::kTemperature, {}, "temperature"},
      {column::kVelocityX, {"u", "velocityx", "xvelocity", "velx"}, ""},
      {column::kMomentumX, {"momentumx", "xmomentum", "momx"}, ""},
      {column::kDensity, {"rho"}, "density"},
  };
  return synonyms;
}

int CanonicalizeColumns(ResultTable* table, const std::vector<ColumnSynonym>& synonyms) {
  if (!table) {
    return 0;
  }
  int renamed = 0;
  std::set<std::string> claimed;
  std::vector<std::string> new_names = table->names;
  for (size_t i = 0; i < table->names.size(); ++i) {
    const std::string key = ColumnKey(table->names[i]);
    if (key.empty()) {
      continue;
    }
    for (const auto& rule : synonyms) {
      if (!MatchesSynonym(key, rule)) {
        continue;
      }
      if (claimed.insert(rule.canonical).second) {
        if (new_names[i] != rule.canonical) {
          ++renamed;
        }
        new_names[i] = rule.canonical;
      }
      break;
    }
  }
  table->names = std::move(new_names);

  if (!table->HasColumn(column::kVelocityX) &&
      table->HasColumn(column::kMomentumX) && table->HasColumn(column::kDensity)) {
    const std::vector<double>& mom = table->Column(column::kMomentumX);
    const std::vector<double>& rho = table->Column(column::kDensity);
    std::vector<double> u(mom.size());
    for (size_t r = 0; r < mom.size(); ++r) {
      u[r] = mom[r] / rho[r];
    }
    table->names.push_back(column::kVelocityX);
    table->columns.push_back(std::move(u));
  }
  return renamed;
}

TableReadResult ParseTecplotTable(const std::string& content) {
  TableReadResult result;
  std::vector<std::string> lines;
  {
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      lines.push_back(line);
    }
  }

  std::vector<std::string> names;
  size_t body_start = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string upper = prtcal::ToUpper(lines[i]);
    if (upper.find("VARIABLES") != std::string::npos) {
      names = ExtractQuotedNames(lines[i]);
    }
    if (upper.find("ZONE") != std::string::npos) {
      body_start = i + 1;
      break;
    }
  }
  result.header_lines = static_cast<int>(body_start);

  size_t column_count = names.size();
  std::vector<std::vector<double>> columns;
  std::vector<double> row;
  for (size_t i = body_start; i < lines.size(); ++i) {
    const std::vector<std::string> tokens = prtcal::SplitWhitespace(lines[i]);
    if (tokens.empty()) {
      continue;
    }
    if (!ParseNumericRow(tokens, &row)) {
      ++result.dropped_rows;
      continue;
    }
    if (column_count == 0) {
      column_count = row.size();
    }
    if (row.size() != column_count) {
      ++result.dropped_rows;
      continue;
    }
    if (columns.empty()) {
      columns.resize(column_count);
    }
    for (size_t c = 0; c < column_count; ++c) {
      columns[c].push_back(row[c]);
    }
  }

  if (columns.empty()) {
    return Unparseable(std::move(result), "no numeric rows in solver output");
  }
  if (names.size() != column_count) {
    names.assign(column_count, std::string());
  }
  result.table.names = std::move(names);
  result.table.columns = std::move(columns);
  CanonicalizeColumns(&result.table);

  const char* required[] = {column::kX, column::kTemperature, column::kVelocityX};
  for (const char* name : required) {
    if (!result.table.HasColumn(name)) {
      return Unparseable(std::move(result),
                         std::string("missing required column after rename: ") + name);
    }
  }
  result.ok = true;
  return result;
}

TableReadResult ReadTecplotTable(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    TableReadResult result;
    result.ok = false;
    result.error = "failed to open solver output: " + path.string();
    return result;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return ParseTecplotTable(buffer.str());
}
