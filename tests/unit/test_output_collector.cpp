#include <gtest/gtest.h>
#include "output_collector.h"

namespace runcage {
namespace {

class OutputCollectorTest : public ::testing::Test {
protected:
    static RawOutput from_stdout(const std::string& text) {
        RawOutput raw;
        raw.stdout_data = text;
        return raw;
    }

    static FileContent file(const std::string& data, bool truncated = false) {
        FileContent content;
        content.data = data;
        content.size_bytes = data.size();
        content.truncated = truncated;
        return content;
    }

    OutputCollector collector{1024};
};

// ============================================================================
// Tabular (CSV)
// ============================================================================

TEST_F(OutputCollectorTest, TabularKeepsColumnOrderAndRows) {
    auto result = collector.collect(from_stdout("title,price,url\nA,1,http://a\nB,2,http://b\n"),
                                    OutputFormat::TABULAR);

    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result));
    const auto& output = std::get<CollectedOutput>(result);
    const auto& table = std::get<TabularOutput>(output.data);
    EXPECT_EQ(table.columns, (std::vector<std::string>{"title", "price", "url"}));
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[1][2], "http://b");
    EXPECT_EQ(output.source, "stdout");
    EXPECT_EQ(output.record_count(), 2u);
}

TEST_F(OutputCollectorTest, TabularHandlesQuotingAndCrlf) {
    auto result = OutputCollector::parse(
        "name,quote\r\n\"Smith, J\",\"He said \"\"hi\"\"\"\r\nplain,\"multi\nline\"\r\n",
        OutputFormat::TABULAR);

    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result));
    const auto& table = std::get<TabularOutput>(std::get<CollectedOutput>(result).data);
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[0][0], "Smith, J");
    EXPECT_EQ(table.rows[0][1], "He said \"hi\"");
    EXPECT_EQ(table.rows[1][1], "multi\nline");
}

TEST_F(OutputCollectorTest, TabularRaggedRowIsUnparseable) {
    auto result = OutputCollector::parse("a,b\n1,2\n3\n", OutputFormat::TABULAR);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    const auto& error = std::get<CollectionError>(result);
    EXPECT_EQ(error.kind, CollectionErrorKind::UNPARSEABLE);
    EXPECT_EQ(error.raw, "a,b\n1,2\n3\n") << "Raw text is kept for diagnostics";
}

TEST_F(OutputCollectorTest, TabularHeaderOnlyIsEmpty) {
    auto result = OutputCollector::parse("a,b\n", OutputFormat::TABULAR);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    EXPECT_EQ(std::get<CollectionError>(result).kind, CollectionErrorKind::EMPTY);
}

TEST_F(OutputCollectorTest, TabularRejectsDuplicateColumns) {
    auto result = OutputCollector::parse("a,a\n1,2\n", OutputFormat::TABULAR);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    EXPECT_EQ(std::get<CollectionError>(result).kind, CollectionErrorKind::UNPARSEABLE);
}

TEST_F(OutputCollectorTest, TabularRejectsStrayQuote) {
    auto result = OutputCollector::parse("a,b\n1,x\"y\n", OutputFormat::TABULAR);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    EXPECT_EQ(std::get<CollectionError>(result).kind, CollectionErrorKind::UNPARSEABLE);
}

// ============================================================================
// Document (JSON)
// ============================================================================

TEST_F(OutputCollectorTest, DocumentArrayOfRecords) {
    auto result = OutputCollector::parse("[{\"title\": \"A\"}, {\"title\": \"B\"}]",
                                         OutputFormat::DOCUMENT);

    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result));
    const auto& output = std::get<CollectedOutput>(result);
    EXPECT_EQ(output.record_count(), 2u);
    EXPECT_EQ(std::get<DocumentOutput>(output.data).root[1]["title"].asString(), "B");
}

TEST_F(OutputCollectorTest, DocumentObjectCountsAsOneRecord) {
    auto result = OutputCollector::parse("{\"count\": 3}", OutputFormat::DOCUMENT);

    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result));
    EXPECT_EQ(std::get<CollectedOutput>(result).record_count(), 1u);
}

TEST_F(OutputCollectorTest, DocumentTrailingGarbageIsUnparseable) {
    auto result = OutputCollector::parse("{\"a\": 1} extra", OutputFormat::DOCUMENT);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    EXPECT_EQ(std::get<CollectionError>(result).kind, CollectionErrorKind::UNPARSEABLE);
}

TEST_F(OutputCollectorTest, DocumentScalarRootIsUnparseable) {
    auto result = OutputCollector::parse("42", OutputFormat::DOCUMENT);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    EXPECT_EQ(std::get<CollectionError>(result).kind, CollectionErrorKind::UNPARSEABLE);
}

TEST_F(OutputCollectorTest, DocumentWithByteOrderMarkParses) {
    auto result = collector.collect(from_stdout("\xEF\xBB\xBF[{\"a\": 1}]"), OutputFormat::DOCUMENT);

    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result))
        << std::get<CollectionError>(result).message;
    EXPECT_EQ(std::get<CollectedOutput>(result).record_count(), 1u);
}

TEST_F(OutputCollectorTest, DocumentEmptyArrayIsEmpty) {
    auto result = OutputCollector::parse("[]", OutputFormat::DOCUMENT);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    EXPECT_EQ(std::get<CollectionError>(result).kind, CollectionErrorKind::EMPTY);
}

// ============================================================================
// Markup (XML)
// ============================================================================

TEST_F(OutputCollectorTest, MarkupRecordsWithAttributesAndFields) {
    auto result = OutputCollector::parse(
        "<?xml version=\"1.0\"?>\n"
        "<items>\n"
        "  <item id=\"1\"><title>A</title><price>1.00</price></item>\n"
        "  <item id=\"2\"><title>B</title><price/></item>\n"
        "</items>\n",
        OutputFormat::MARKUP);

    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result));
    const auto& markup = std::get<MarkupOutput>(std::get<CollectedOutput>(result).data);
    EXPECT_EQ(markup.root_tag, "items");
    ASSERT_EQ(markup.records.size(), 2u);
    EXPECT_EQ(markup.records[0].attributes[0].second, "1");
    EXPECT_EQ(markup.records[0].fields[1].first, "price");
    EXPECT_EQ(markup.records[1].fields[1].second, "");
}

TEST_F(OutputCollectorTest, MarkupNestedFieldIsUnparseable) {
    auto result = OutputCollector::parse("<r><i><f><g>x</g></f></i></r>", OutputFormat::MARKUP);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    EXPECT_EQ(std::get<CollectionError>(result).kind, CollectionErrorKind::UNPARSEABLE);
}

TEST_F(OutputCollectorTest, MarkupMalformedIsUnparseable) {
    auto result = OutputCollector::parse("<r><i></r>", OutputFormat::MARKUP);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    EXPECT_EQ(std::get<CollectionError>(result).kind, CollectionErrorKind::UNPARSEABLE);
}

TEST_F(OutputCollectorTest, MarkupRootWithoutRecordsIsEmpty) {
    auto result = OutputCollector::parse("<items/>", OutputFormat::MARKUP);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    EXPECT_EQ(std::get<CollectionError>(result).kind, CollectionErrorKind::EMPTY);
}

// ============================================================================
// Source selection and bounds
// ============================================================================

TEST_F(OutputCollectorTest, BlankOutputIsEmpty) {
    auto result = collector.collect(from_stdout("  \n\t\n"), OutputFormat::DOCUMENT);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    EXPECT_EQ(std::get<CollectionError>(result).kind, CollectionErrorKind::EMPTY);
}

TEST_F(OutputCollectorTest, PrefersDeclaredArtifactOverStdout) {
    // Given: progress chatter on stdout and a clean output.json artifact
    RawOutput raw = from_stdout("fetching page 1...\n");
    raw.files["output.json"] = file("[{\"a\": 1}]");
    raw.files["output.csv"] = file("not,the\ndeclared,one\n");

    // When: collecting a document
    auto result = collector.collect(raw, OutputFormat::DOCUMENT);

    // Then: the artifact for the declared format wins
    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result));
    EXPECT_EQ(std::get<CollectedOutput>(result).source, "output.json");
}

TEST_F(OutputCollectorTest, OversizedOutputIsTruncatedAndBounded) {
    std::string big = "a\n" + std::string(2000, 'x') + "\n";

    auto result = collector.collect(from_stdout(big), OutputFormat::TABULAR);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    const auto& error = std::get<CollectionError>(result);
    EXPECT_EQ(error.kind, CollectionErrorKind::TRUNCATED);
    EXPECT_EQ(error.raw.size(), 1024u);
}

TEST_F(OutputCollectorTest, TruncatedArtifactIsTruncated) {
    RawOutput raw;
    raw.files["output.csv"] = file("a\n1\n", true);

    auto result = collector.collect(raw, OutputFormat::TABULAR);

    ASSERT_TRUE(std::holds_alternative<CollectionError>(result));
    EXPECT_EQ(std::get<CollectionError>(result).kind, CollectionErrorKind::TRUNCATED);
    EXPECT_EQ(std::get<CollectionError>(result).source, "output.csv");
}

TEST_F(OutputCollectorTest, OutputFilenameFollowsFormat) {
    EXPECT_EQ(OutputCollector::output_filename(OutputFormat::TABULAR), "output.csv");
    EXPECT_EQ(OutputCollector::output_filename(OutputFormat::DOCUMENT), "output.json");
    EXPECT_EQ(OutputCollector::output_filename(OutputFormat::MARKUP), "output.xml");
}

// ============================================================================
// Serializers read back by their parsers
// ============================================================================

TEST_F(OutputCollectorTest, TabularSerializeParses) {
    TabularOutput table;
    table.columns = {"name", "note"};
    table.rows = {{"a, b", "say \"x\""}, {"", "line\nbreak"}};

    auto result = formats::parse_tabular(formats::serialize_tabular(table));

    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result));
    EXPECT_EQ(std::get<TabularOutput>(std::get<CollectedOutput>(result).data), table);
}

TEST_F(OutputCollectorTest, TabularSerializeKeepsEdgeValues) {
    TabularOutput table;
    table.columns = {"\xEF\xBB\xBFid", " padded ", "crlf"};
    table.rows = {{" ", "", "a\r\nb"},
                  {"\"", "lone\rcr", "trailing,"}};

    auto result = formats::parse_tabular(formats::serialize_tabular(table));

    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result))
        << std::get<CollectionError>(result).message;
    EXPECT_EQ(std::get<TabularOutput>(std::get<CollectedOutput>(result).data), table);
}

TEST_F(OutputCollectorTest, DocumentSerializeParses) {
    DocumentOutput document;
    document.root["name"] = "widget";
    document.root["tags"].append("a");
    document.root["tags"].append("b");

    auto result = formats::parse_document(formats::serialize(document));

    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result));
    EXPECT_EQ(std::get<DocumentOutput>(std::get<CollectedOutput>(result).data), document);
}

TEST_F(OutputCollectorTest, DocumentSerializeKeepsEdgeValues) {
    DocumentOutput document;
    Json::Value record;
    record["blank"] = " ";
    record["empty"] = "";
    record["crlf"] = "a\r\nb";
    record["accented"] = "caf\xC3\xA9";
    record["control"] = "bell\x07";
    record["big"] = Json::Int64(9007199254740993LL);
    record["negative"] = -42;
    record["fraction"] = 0.1;
    record["none"] = Json::Value();
    record["flag"] = false;
    record["nested"] = Json::Value(Json::arrayValue);
    record["object"] = Json::Value(Json::objectValue);
    document.root.append(record);

    auto result = formats::parse_document(formats::serialize(document));

    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result))
        << std::get<CollectionError>(result).message;
    EXPECT_EQ(std::get<DocumentOutput>(std::get<CollectedOutput>(result).data), document);
}

TEST_F(OutputCollectorTest, MarkupSerializeParses) {
    MarkupOutput markup;
    markup.root_tag = "items";
    MarkupRecord record;
    record.tag = "item";
    record.attributes = {{"id", "7"}, {"empty", ""}, {"note", "x\r\ny\tz \"q\""}};
    record.fields = {{"title", "Fish & Chips"}, {"price", "<5>"}, {"blank", " "},
                     {"crlf", "a\r\nb"}, {"none", ""}, {"spaced", "\t lead and trail \n"}};
    markup.records.push_back(record);
    MarkupRecord whitespace;
    whitespace.tag = "item";
    whitespace.fields = {{"newline", "\n"}, {"mixed", " \t\r\n"}};
    markup.records.push_back(whitespace);

    auto result = formats::parse_markup(formats::serialize_markup(markup));

    ASSERT_TRUE(std::holds_alternative<CollectedOutput>(result))
        << std::get<CollectionError>(result).message;
    EXPECT_EQ(std::get<MarkupOutput>(std::get<CollectedOutput>(result).data), markup);
}

} // namespace
} // namespace runcage
