/**
 * @file csv_table.cpp
 * @brief CSV table reader implementation.
 * @author oafield developers
 */

#include "oafield/table/csv_table.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <utility>

namespace oafield::table {
namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::string_view trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

bool is_blank(std::string_view line) { return trim(line).empty(); }

// An odd quote count leaves a field open; doubled quotes count twice.
bool ends_inside_quotes(std::string_view record) {
  std::size_t quotes = 0;
  for (const char ch : record) {
    if (ch == '"') {
      ++quotes;
    }
  }
  return quotes % 2 == 1;
}

// Reads one record, joining physical lines while a quoted field is still open.
bool read_csv_record(std::istream& in, std::string& record) {
  if (!std::getline(in, record)) {
    return false;
  }
  std::string next;
  while (ends_inside_quotes(record) && std::getline(in, next)) {
    record.push_back('\n');
    record += next;
  }
  return true;
}

}  // namespace

std::vector<std::string> split_csv_record(std::string_view line) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quoted) {
      if (ch == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field.push_back(ch);
      }
      continue;
    }
    if (ch == '"') {
      quoted = true;
    } else if (ch == ',') {
      fields.push_back(std::move(field));
      field.clear();
    } else if (ch != '\r' && ch != '\n') {
      field.push_back(ch);
    }
  }
  fields.push_back(std::move(field));
  return fields;
}

std::optional<double> parse_numeric_cell(std::string_view text) {
  const std::string token(trim(text));
  if (token.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double v = std::strtod(token.c_str(), &end);
  if (end == token.c_str() || *end != '\0') {
    return std::nullopt;
  }
  if (std::isnan(v)) {
    return std::nullopt;
  }
  return v;
}

TableLoad parse_csv_table(std::istream& in) {
  std::string line;
  bool have_header = false;
  while (read_csv_record(in, line)) {
    if (!is_blank(line)) {
      have_header = true;
      break;
    }
  }
  if (!have_header) {
    return TableLoad{.status = core::Status::DataUnavailable};
  }

  std::string_view header_view(line);
  if (header_view.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
    header_view.remove_prefix(kUtf8Bom.size());
  }
  std::vector<std::string> columns;
  for (const auto& name : split_csv_record(header_view)) {
    columns.emplace_back(trim(name));
  }

  RawTable table(std::move(columns));
  while (read_csv_record(in, line)) {
    if (is_blank(line)) {
      continue;
    }
    const auto fields = split_csv_record(line);
    RawTable::Row row;
    row.reserve(table.column_count());
    for (std::size_t c = 0; c < table.column_count() && c < fields.size(); ++c) {
      row.push_back(parse_numeric_cell(fields[c]));
    }
    table.add_row(std::move(row));
  }
  return TableLoad{.table = std::move(table), .status = core::Status::Ok};
}

TableLoad load_csv_table(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return TableLoad{.status = core::Status::DataUnavailable};
  }
  return parse_csv_table(in);
}

}  // namespace oafield::table
