#pragma once

#include "cdnet/protocol/error.hpp"
#include "cdnet/protocol/values.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cdnet::types {

/// One data source of a data set, e.g. "value:GAUGE:0:U".
/// min and max are kept as written; "U" means unbounded.
struct DataSource {
    std::string name;
    protocol::ValueKind kind = protocol::ValueKind::Gauge;
    std::string min;
    std::string max;

    bool operator==(const DataSource &) const = default;
};

struct DataSet {
    std::string name;
    std::vector<DataSource> sources;
};

/// Data-set name -> ordered data sources.
using TypesDB = std::map<std::string, std::vector<DataSource>>;

/// Raised for any types.db problem. line() is 1-based, or 0 when the error
/// is not tied to a line (single-line parses, unreadable files).
class SchemaError : public std::runtime_error {
  public:
    SchemaError(ErrorKind kind, const std::string &message, size_t line = 0);

    [[nodiscard]] ErrorKind kind() const { return kind_; }
    [[nodiscard]] size_t line() const { return line_; }

  private:
    ErrorKind kind_;
    size_t line_;
};

/// Parse one types.db line: "name ds1:KIND:min:max, ds2:KIND:min:max ...".
/// Fields are separated by spaces, tabs or commas.
/// Throws SchemaError on fewer than two fields, a data source without exactly
/// four ':'-separated parts, or a kind outside absolute/counter/derive/gauge.
DataSet parse_data_set(std::string_view line);

/// Parse a whole types.db document. Blank lines and '#' comments are
/// skipped; a repeated name replaces the earlier definition.
/// Any bad line aborts the parse; the error carries its line number.
TypesDB parse_types_db(std::string_view text);

/// Read and parse a types.db file.
TypesDB load_types_db(const std::filesystem::path &path);

/// Returns nullptr if name is not defined.
[[nodiscard]] const std::vector<DataSource> *find_data_set(const TypesDB &db,
                                                           const std::string &name);

void to_json(nlohmann::json &j, const DataSource &source);

} // namespace cdnet::types
