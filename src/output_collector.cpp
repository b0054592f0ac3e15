#include "output_collector.h"
#include <algorithm>
#include <cctype>
#include <memory>
#include <set>
#include <sstream>
#include <tinyxml2.h>

namespace runcage {

namespace {

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

CollectionError make_error(CollectionErrorKind kind, const std::string& message,
                           const std::string& raw) {
    CollectionError error;
    error.kind = kind;
    error.message = message;
    error.raw = raw;
    return error;
}

CollectedOutput make_output(OutputFormat format, StructuredOutput data, const std::string& raw) {
    CollectedOutput output;
    output.format = format;
    output.data = std::move(data);
    output.raw = raw;
    return output;
}

// RFC 4180 reader. Quoted fields may hold separators, quotes ("") and line
// breaks; a quote anywhere else is an error.
class CsvReader {
public:
    explicit CsvReader(const std::string& text) : text_(text) {
        // UTF-8 byte order mark
        if (text_.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            pos_ = 3;
        }
    }

    // Reads the next record. Returns false at end of input.
    bool next(std::vector<std::string>& record) {
        record.clear();
        skip_blank_lines();
        if (pos_ >= text_.size()) {
            return false;
        }

        std::string field;
        while (true) {
            if (pos_ < text_.size() && text_[pos_] == '"') {
                read_quoted(field);
            } else {
                read_plain(field);
            }
            record.push_back(std::move(field));
            field.clear();

            if (pos_ >= text_.size()) {
                return true;
            }
            char c = text_[pos_];
            if (c == ',') {
                ++pos_;
                continue;
            }
            consume_line_break();
            return true;
        }
    }

    size_t line() const { return line_; }

private:
    void skip_blank_lines() {
        while (pos_ < text_.size() && (text_[pos_] == '\n' || text_[pos_] == '\r')) {
            consume_line_break();
        }
    }

    void consume_line_break() {
        if (text_[pos_] == '\r' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '\n') {
            ++pos_;
        }
        ++pos_;
        ++line_;
    }

    void read_plain(std::string& field) {
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == ',' || c == '\n' || c == '\r') {
                return;
            }
            if (c == '"') {
                throw std::invalid_argument("unexpected quote in unquoted field on line " +
                                            std::to_string(line_));
            }
            field += c;
            ++pos_;
        }
    }

    void read_quoted(std::string& field) {
        size_t start_line = line_;
        ++pos_;  // opening quote
        while (true) {
            if (pos_ >= text_.size()) {
                throw std::invalid_argument("unterminated quoted field starting on line " +
                                            std::to_string(start_line));
            }
            char c = text_[pos_++];
            if (c == '"') {
                if (pos_ < text_.size() && text_[pos_] == '"') {
                    field += '"';
                    ++pos_;
                    continue;
                }
                break;
            }
            if (c == '\n') {
                ++line_;
            }
            field += c;
        }
        if (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c != ',' && c != '\n' && c != '\r') {
                throw std::invalid_argument("characters after closing quote on line " +
                                            std::to_string(line_));
            }
        }
    }

    const std::string& text_;
    size_t pos_ = 0;
    size_t line_ = 1;
};

bool needs_quoting(const std::string& field) {
    // A leading byte order mark would be stripped by the reader
    return field.find_first_of(",\"\r\n") != std::string::npos ||
           field.compare(0, 3, "\xEF\xBB\xBF") == 0;
}

void write_csv_field(std::ostringstream& out, const std::string& field) {
    if (!needs_quoting(field)) {
        out << field;
        return;
    }
    out << '"';
    for (char c : field) {
        if (c == '"') out << '"';
        out << c;
    }
    out << '"';
}

void write_csv_record(std::ostringstream& out, const std::vector<std::string>& record) {
    // A lone empty field would read back as a blank line
    if (record.size() == 1 && record[0].empty()) {
        out << "\"\"\n";
        return;
    }
    for (size_t i = 0; i < record.size(); ++i) {
        if (i > 0) out << ',';
        write_csv_field(out, record[i]);
    }
    out << '\n';
}

// XMLPrinter whose output parses back to the exact bytes it was given.
// tinyxml2 drops whitespace-only text and normalizes raw carriage returns,
// so those go out as character references.
class ExactPrinter : public tinyxml2::XMLPrinter {
public:
    // Only valid straight after OpenElement, like PushAttribute
    void PushExactAttribute(const std::string& name, const std::string& value) {
        Print(" %s=\"%s\"", name.c_str(), escape(value, true).c_str());
    }

    void PushExactText(const std::string& value) {
        PushText("");  // closes the start tag
        Print("%s", escape(value, false).c_str());
    }

private:
    static std::string escape(const std::string& value, bool attribute) {
        bool blank = is_blank(value);
        std::string out;
        out.reserve(value.size());
        for (char c : value) {
            switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += attribute ? "&quot;" : "\""; break;
                case '\r': out += "&#13;"; break;
                case '\n': out += (attribute || blank) ? "&#10;" : "\n"; break;
                case '\t': out += (attribute || blank) ? "&#9;" : "\t"; break;
                case ' ': out += blank ? "&#32;" : " "; break;
                default: out += c;
            }
        }
        return out;
    }
};

bool has_element_children(const tinyxml2::XMLElement* element) {
    return element->FirstChildElement() != nullptr;
}

// Text directly inside `element` that is not whitespace
bool has_loose_text(const tinyxml2::XMLElement* element) {
    for (const tinyxml2::XMLNode* node = element->FirstChild(); node; node = node->NextSibling()) {
        const tinyxml2::XMLText* text = node->ToText();
        if (text && text->Value() && !is_blank(text->Value())) {
            return true;
        }
    }
    return false;
}

} // namespace

size_t CollectedOutput::record_count() const {
    if (const auto* table = std::get_if<TabularOutput>(&data)) {
        return table->rows.size();
    }
    if (const auto* document = std::get_if<DocumentOutput>(&data)) {
        return document->root.isArray() ? document->root.size() : 1;
    }
    if (const auto* markup = std::get_if<MarkupOutput>(&data)) {
        return markup->records.size();
    }
    return 0;
}

std::string to_string(CollectionErrorKind kind) {
    switch (kind) {
        case CollectionErrorKind::EMPTY: return "empty";
        case CollectionErrorKind::UNPARSEABLE: return "unparseable";
        case CollectionErrorKind::TRUNCATED: return "truncated";
    }
    return "unknown";
}

OutputCollector::OutputCollector(size_t max_output_bytes)
    : max_output_bytes_(max_output_bytes) {}

std::string OutputCollector::output_filename(OutputFormat format) {
    return "output." + format_extension(format);
}

CollectionResult OutputCollector::collect(const RawOutput& raw, OutputFormat declared_format) const {
    std::string source = "stdout";
    const std::string* text = &raw.stdout_data;
    bool truncated = raw.stdout_truncated;

    auto artifact = raw.files.find(output_filename(declared_format));
    if (artifact != raw.files.end()) {
        source = artifact->first;
        text = &artifact->second.data;
        truncated = artifact->second.truncated;
    }

    CollectionResult result;
    if (truncated || text->size() > max_output_bytes_) {
        std::string prefix = text->substr(0, std::min(text->size(), max_output_bytes_));
        result = make_error(CollectionErrorKind::TRUNCATED,
                            "output from " + source + " exceeded " +
                                std::to_string(max_output_bytes_) + " bytes",
                            prefix);
    } else {
        result = parse(*text, declared_format);
    }

    std::visit([&source](auto& value) { value.source = source; }, result);
    return result;
}

CollectionResult OutputCollector::parse(const std::string& text, OutputFormat format) {
    if (is_blank(text)) {
        return make_error(CollectionErrorKind::EMPTY, "script produced no output", text);
    }

    switch (format) {
        case OutputFormat::TABULAR: return formats::parse_tabular(text);
        case OutputFormat::DOCUMENT: return formats::parse_document(text);
        case OutputFormat::MARKUP: return formats::parse_markup(text);
    }
    return make_error(CollectionErrorKind::UNPARSEABLE, "unknown output format", text);
}

namespace formats {

CollectionResult parse_tabular(const std::string& text) {
    TabularOutput table;
    CsvReader reader(text);

    try {
        std::vector<std::string> record;
        if (!reader.next(record)) {
            return make_error(CollectionErrorKind::EMPTY, "CSV output has no header row", text);
        }

        std::set<std::string> seen;
        for (const auto& column : record) {
            if (column.empty()) {
                return make_error(CollectionErrorKind::UNPARSEABLE,
                                  "CSV header contains an empty column name", text);
            }
            if (!seen.insert(column).second) {
                return make_error(CollectionErrorKind::UNPARSEABLE,
                                  "CSV header repeats column '" + column + "'", text);
            }
        }
        table.columns = record;

        while (reader.next(record)) {
            if (record.size() != table.columns.size()) {
                return make_error(CollectionErrorKind::UNPARSEABLE,
                                  "CSV row ending on line " + std::to_string(reader.line() - 1) +
                                      " has " + std::to_string(record.size()) + " fields, expected " +
                                      std::to_string(table.columns.size()),
                                  text);
            }
            table.rows.push_back(record);
        }
    } catch (const std::invalid_argument& e) {
        return make_error(CollectionErrorKind::UNPARSEABLE, std::string("CSV ") + e.what(), text);
    }

    if (table.rows.empty()) {
        return make_error(CollectionErrorKind::EMPTY, "CSV output has a header but no rows", text);
    }
    return make_output(OutputFormat::TABULAR, std::move(table), text);
}

CollectionResult parse_document(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    // Tolerate a UTF-8 byte order mark, as the CSV reader does
    builder.settings_["skipBom"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    DocumentOutput document;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &document.root, &errors)) {
        return make_error(CollectionErrorKind::UNPARSEABLE, "JSON " + errors, text);
    }
    if (!document.root.isObject() && !document.root.isArray()) {
        return make_error(CollectionErrorKind::UNPARSEABLE,
                          "JSON document root must be an object or an array", text);
    }
    if (document.root.empty()) {
        return make_error(CollectionErrorKind::EMPTY, "JSON document has no entries", text);
    }
    return make_output(OutputFormat::DOCUMENT, std::move(document), text);
}

CollectionResult parse_markup(const std::string& text) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(text.data(), text.size()) != tinyxml2::XML_SUCCESS) {
        return make_error(CollectionErrorKind::UNPARSEABLE,
                          std::string("XML ") + (doc.ErrorStr() ? doc.ErrorStr() : "parse error"),
                          text);
    }

    const tinyxml2::XMLElement* root = doc.RootElement();
    if (!root) {
        return make_error(CollectionErrorKind::EMPTY, "XML document has no root element", text);
    }
    if (has_loose_text(root)) {
        return make_error(CollectionErrorKind::UNPARSEABLE,
                          "XML root element holds text outside of records", text);
    }

    MarkupOutput markup;
    markup.root_tag = root->Name();

    for (const tinyxml2::XMLElement* element = root->FirstChildElement(); element;
         element = element->NextSiblingElement()) {
        MarkupRecord record;
        record.tag = element->Name();

        for (const tinyxml2::XMLAttribute* attr = element->FirstAttribute(); attr; attr = attr->Next()) {
            record.attributes.emplace_back(attr->Name(), attr->Value());
        }
        if (has_loose_text(element)) {
            return make_error(CollectionErrorKind::UNPARSEABLE,
                              "XML record <" + record.tag + "> holds text outside of fields", text);
        }

        for (const tinyxml2::XMLElement* field = element->FirstChildElement(); field;
             field = field->NextSiblingElement()) {
            if (has_element_children(field)) {
                return make_error(CollectionErrorKind::UNPARSEABLE,
                                  "XML field <" + std::string(field->Name()) + "> in record <" +
                                      record.tag + "> is nested",
                                  text);
            }
            const char* value = field->GetText();
            record.fields.emplace_back(field->Name(), value ? value : "");
        }

        markup.records.push_back(std::move(record));
    }

    if (markup.records.empty()) {
        return make_error(CollectionErrorKind::EMPTY,
                          "XML root <" + markup.root_tag + "> has no records", text);
    }
    return make_output(OutputFormat::MARKUP, std::move(markup), text);
}

std::string serialize_tabular(const TabularOutput& output) {
    std::ostringstream out;
    write_csv_record(out, output.columns);
    for (const auto& row : output.rows) {
        write_csv_record(out, row);
    }
    return out.str();
}

std::string serialize_document(const DocumentOutput& output) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, output.root) + "\n";
}

std::string serialize_markup(const MarkupOutput& output) {
    ExactPrinter printer;
    printer.PushHeader(false, true);
    printer.OpenElement(output.root_tag.c_str());
    for (const auto& record : output.records) {
        printer.OpenElement(record.tag.c_str());
        for (const auto& [name, value] : record.attributes) {
            printer.PushExactAttribute(name, value);
        }
        for (const auto& [name, value] : record.fields) {
            printer.OpenElement(name.c_str(), true);
            printer.PushExactText(value);
            printer.CloseElement(true);
        }
        printer.CloseElement();
    }
    printer.CloseElement();
    return printer.CStr();
}

std::string serialize(const StructuredOutput& output) {
    if (const auto* table = std::get_if<TabularOutput>(&output)) {
        return serialize_tabular(*table);
    }
    if (const auto* document = std::get_if<DocumentOutput>(&output)) {
        return serialize_document(*document);
    }
    return serialize_markup(std::get<MarkupOutput>(output));
}

} // namespace formats

} // namespace runcage
