// Reader for solver volume output in Tecplot ASCII point format.
#ifndef TECPLOT_READER_H
#define TECPLOT_READER_H

#include <filesystem>
#include <string>
#include <vector>

// Column-major numeric table; every column holds row_count() values.
struct ResultTable {
  std::vector<std::string> names;
  std::vector<std::vector<double>> columns;

  size_t row_count() const { return columns.empty() ? 0 : columns.front().size(); }
  int FindColumn(const std::string& name) const;
  bool HasColumn(const std::string& name) const { return FindColumn(name) >= 0; }
  const std::vector<double>& Column(const std::string& name) const;
};

struct TableReadResult {
  bool ok = false;
  std::string error;
  ResultTable table;
  int header_lines = 0;
  int dropped_rows = 0;
};

// Canonical column names produced by CanonicalizeColumns.
namespace column {
constexpr const char* kX = "x";
constexpr const char* kTemperature = "T";
constexpr const char* kVelocityX = "u";
constexpr const char* kMomentumX = "mom_x";
constexpr const char* kDensity = "rho";
}  // namespace column

// One synonym rule, matched against the column key: the lowercase name with
// '_', '-', '.' and spaces removed ("Velocity_x" -> "velocityx"). A key matches
// when it equals an entry of `exact`, or contains `stem` (if set).
struct ColumnSynonym {
  std::string canonical;
  std::vector<std::string> exact;
  std::string stem;
};

// Lowercase column name without separators.
std::string ColumnKey(const std::string& name);

// Rules in precedence order; the first rule matching a column names it.
const std::vector<ColumnSynonym>& DefaultColumnSynonyms();

// Renames columns to canonical names. A canonical name is claimed by the first
// column (in file order) that maps to it; later columns keep their original name.
// Derives u = mom_x / rho when u is absent. Returns the number of renamed columns.
int CanonicalizeColumns(ResultTable* table,
                        const std::vector<ColumnSynonym>& synonyms = DefaultColumnSynonyms());

// Splits the header into quoted variable names and locates the end of the
// header. Rows that fail to tokenize into numbers are dropped, not fatal.
TableReadResult ParseTecplotTable(const std::string& content);
TableReadResult ReadTecplotTable(const std::filesystem::path& path);

#endif  // TECPLOT_READER_H
