#pragma once

#include <string>
#include <vector>
#include <map>
#include <variant>
#include <utility>
#include <json/json.h>
#include "types.h"
#include "file_utils.h"

namespace runcage {

// Tabular output (CSV): header row names the fields, every row has one value
// per column, column order is the order in the source.
struct TabularOutput {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    bool operator==(const TabularOutput& other) const {
        return columns == other.columns && rows == other.rows;
    }
};

// Key-value document output (JSON object or array)
struct DocumentOutput {
    Json::Value root;

    bool operator==(const DocumentOutput& other) const { return root == other.root; }
};

// One record element of a markup document
struct MarkupRecord {
    std::string tag;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::vector<std::pair<std::string, std::string>> fields;   // Child element name -> text

    bool operator==(const MarkupRecord& other) const {
        return tag == other.tag && attributes == other.attributes && fields == other.fields;
    }
};

// Markup output (XML): <root><record><field>text</field>...</record>...</root>
struct MarkupOutput {
    std::string root_tag;
    std::vector<MarkupRecord> records;

    bool operator==(const MarkupOutput& other) const {
        return root_tag == other.root_tag && records == other.records;
    }
};

using StructuredOutput = std::variant<TabularOutput, DocumentOutput, MarkupOutput>;

// Successfully parsed output
struct CollectedOutput {
    OutputFormat format = OutputFormat::TABULAR;
    StructuredOutput data;
    std::string raw;        // Source text, verbatim
    std::string source;     // "stdout" or the artifact filename

    size_t record_count() const;
};

enum class CollectionErrorKind {
    EMPTY,          // Nothing usable was produced
    UNPARSEABLE,    // Output does not parse as the declared format
    TRUNCATED       // Output exceeded the size ceiling
};

std::string to_string(CollectionErrorKind kind);

// Why output could not be collected; keeps raw text for diagnostics
struct CollectionError {
    CollectionErrorKind kind = CollectionErrorKind::EMPTY;
    std::string message;
    std::string raw;
    std::string source;
};

using CollectionResult = std::variant<CollectedOutput, CollectionError>;

// What a finished sandbox left behind
struct RawOutput {
    std::string stdout_data;
    bool stdout_truncated = false;
    std::map<std::string, FileContent> files;    // Working directory artifacts
};

class OutputCollector {
public:
    explicit OutputCollector(size_t max_output_bytes = MAX_OUTPUT_SIZE);

    // Pick the source (OUTPUT_FILE artifact, else stdout) and parse it with
    // the parser for the declared format.
    CollectionResult collect(const RawOutput& raw, OutputFormat declared_format) const;

    // Parse text that is already known to be within bounds
    static CollectionResult parse(const std::string& text, OutputFormat format);

    // Name of the artifact a script is asked to write ("output.csv", ...)
    static std::string output_filename(OutputFormat format);

private:
    size_t max_output_bytes_;
};

// Per-format parsers and serializers. Serializers produce text the matching
// parser accepts, so parse(serialize(x)) == x.
namespace formats {

CollectionResult parse_tabular(const std::string& text);
CollectionResult parse_document(const std::string& text);
CollectionResult parse_markup(const std::string& text);

std::string serialize_tabular(const TabularOutput& output);
std::string serialize_document(const DocumentOutput& output);
std::string serialize_markup(const MarkupOutput& output);

std::string serialize(const StructuredOutput& output);

} // namespace formats

} // namespace runcage
