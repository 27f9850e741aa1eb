#include <brvalid/io.hpp>

#include <json/json.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace brvalid {

Column ReadColumn(std::istream& in, const std::string& null_token) {
  Column column;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line == null_token) {
      column.emplace_back(std::nullopt);
    } else {
      column.emplace_back(std::move(line));
    }
  }
  if (in.bad()) {
    throw std::runtime_error("Read error while loading input");
  }
  return column;
}

Column ReadColumnFromPath(const std::string& path, const std::string& null_token) {
  if (path == "-") {
    return ReadColumn(std::cin, null_token);
  }
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open input file: " + path);
  }
  return ReadColumn(file, null_token);
}

void WriteText(std::ostream& out, const std::vector<Cell>& cells,
               const std::string& null_token) {
  for (const auto& cell : cells) {
    if (const bool* b = std::get_if<bool>(&cell)) {
      out << (*b ? "true" : "false");
    } else if (const std::string* s = std::get_if<std::string>(&cell)) {
      out << *s;
    } else {
      out << null_token;
    }
    out << '\n';
  }
}

void WriteJson(std::ostream& out, const std::vector<Cell>& cells) {
  Json::Value array(Json::arrayValue);
  for (const auto& cell : cells) {
    if (const bool* b = std::get_if<bool>(&cell)) {
      array.append(Json::Value(*b));
    } else if (const std::string* s = std::get_if<std::string>(&cell)) {
      array.append(Json::Value(*s));
    } else {
      array.append(Json::Value(Json::nullValue));
    }
  }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
  writer->write(array, &out);
  out << '\n';
}

CellSummary Summarize(const std::vector<Cell>& cells) {
  CellSummary summary;
  summary.rows = cells.size();
  for (const auto& cell : cells) {
    if (const bool* b = std::get_if<bool>(&cell)) {
      ++(*b ? summary.true_count : summary.false_count);
    } else if (std::holds_alternative<std::string>(cell)) {
      ++summary.strings;
    } else {
      ++summary.absent;
    }
  }
  return summary;
}

}  // namespace brvalid
