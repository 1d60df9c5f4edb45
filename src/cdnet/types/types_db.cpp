#include "cdnet/types/types_db.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace cdnet::types {

namespace {

[[nodiscard]] bool is_field_separator(char c) { return c == ' ' || c == '\t' || c == ','; }

/// Split on runs of separators; empty fields are dropped.
[[nodiscard]] std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && is_field_separator(line[pos])) {
            ++pos;
        }
        const size_t start = pos;
        while (pos < line.size() && !is_field_separator(line[pos])) {
            ++pos;
        }
        if (pos > start) {
            fields.push_back(line.substr(start, pos - start));
        }
    }
    return fields;
}

/// Split on every ':'; empty parts are kept.
[[nodiscard]] std::vector<std::string_view> split_colons(std::string_view field) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const size_t colon = field.find(':', start);
        if (colon == std::string_view::npos) {
            parts.push_back(field.substr(start));
            return parts;
        }
        parts.push_back(field.substr(start, colon - start));
        start = colon + 1;
    }
}

[[nodiscard]] std::string quoted(std::string_view s) { return "\"" + std::string(s) + "\""; }

} // namespace

SchemaError::SchemaError(ErrorKind kind, const std::string &message, size_t line)
    : std::runtime_error(line == 0 ? message : "line " + std::to_string(line) + ": " + message),
      kind_(kind), line_(line) {}

DataSet parse_data_set(std::string_view line) {
    const auto fields = split_fields(line);
    if (fields.size() < 2) {
        throw SchemaError(ErrorKind::MalformedSchemaLine,
                          "minimum of 2 fields required " + quoted(line));
    }

    DataSet data_set;
    data_set.name = std::string(fields[0]);
    data_set.sources.reserve(fields.size() - 1);

    for (size_t i = 1; i < fields.size(); ++i) {
        const auto parts = split_colons(fields[i]);
        if (parts.size() != 4) {
            throw SchemaError(ErrorKind::MalformedSchemaLine,
                              "exactly 4 fields required " + quoted(fields[i]));
        }

        const auto kind = protocol::value_kind_from_name(parts[1]);
        if (!kind) {
            throw SchemaError(ErrorKind::UnknownDataSourceKind,
                              "invalid data source type " + quoted(parts[1]));
        }

        data_set.sources.push_back(DataSource{
            .name = std::string(parts[0]),
            .kind = *kind,
            .min = std::string(parts[2]),
            .max = std::string(parts[3]),
        });
    }

    return data_set;
}

TypesDB parse_types_db(std::string_view text) {
    TypesDB db;
    size_t line_no = 0;
    size_t start = 0;

    while (start <= text.size()) {
        const size_t newline = text.find('\n', start);
        const size_t end = newline == std::string_view::npos ? text.size() : newline;
        std::string_view line = text.substr(start, end - start);
        ++line_no;
        start = end + 1;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty() || line.front() == '#') {
            continue;
        }

        try {
            auto data_set = parse_data_set(line);
            db[data_set.name] = std::move(data_set.sources);
        } catch (const SchemaError &e) {
            throw SchemaError(e.kind(), e.what(), line_no);
        }
    }

    return db;
}

TypesDB load_types_db(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw SchemaError(ErrorKind::Io, "cannot open types.db file " + types::quoted(path.string()));
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw SchemaError(ErrorKind::Io, "failed reading types.db file " + types::quoted(path.string()));
    }

    return parse_types_db(contents.str());
}

const std::vector<DataSource> *find_data_set(const TypesDB &db, const std::string &name) {
    auto it = db.find(name);
    if (it != db.end()) {
        return &it->second;
    }
    return nullptr;
}

void to_json(nlohmann::json &j, const DataSource &source) {
    j = nlohmann::json{
        {"name", source.name},
        {"type", std::string(protocol::value_kind_name(source.kind))},
        {"min", source.min},
        {"max", source.max},
    };
}

} // namespace cdnet::types
