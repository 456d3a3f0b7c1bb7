// =============================================================================
// CSV Reader / Writer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geoscan/csv.hpp"
#include "geoscan/error.hpp"

#include <sstream>

using namespace geoscan;

TEST(CsvTest, TypesOnlyNamedNumericColumns) {
    std::istringstream in("id,latitude,longitude,label\n"
                          "1,40.5,-73.25,home\n"
                          "2,-10,12,work\n");
    Table table = read_csv(in, {"latitude", "longitude"});

    ASSERT_EQ(table.schema().size(), 4u);
    // Numeric-looking but not requested: kept as text
    EXPECT_EQ(table.schema().fields()[0].type, FieldType::STRING);
    EXPECT_EQ(table.schema().fields()[1].type, FieldType::DOUBLE);
    EXPECT_EQ(table.schema().fields()[2].type, FieldType::DOUBLE);
    EXPECT_EQ(table.schema().fields()[3].type, FieldType::STRING);
    EXPECT_EQ(std::get<std::string>(table.at(0, "id")), "1");
    ASSERT_EQ(table.num_rows(), 2u);
    EXPECT_DOUBLE_EQ(std::get<double>(table.at(0, "latitude")), 40.5);
    EXPECT_DOUBLE_EQ(std::get<double>(table.at(1, "latitude")), -10.0);
    EXPECT_EQ(std::get<std::string>(table.at(1, "label")), "work");
}

TEST(CsvTest, EmptyCellsAreNull) {
    std::istringstream in("latitude,longitude,label\n"
                          ",1.5,\n"
                          "2.5,,\"\"\n");
    Table table = read_csv(in, {"latitude", "longitude"});

    EXPECT_EQ(table.schema().fields()[0].type, FieldType::DOUBLE);
    EXPECT_TRUE(is_null(table.at(0, "latitude")));
    EXPECT_TRUE(is_null(table.at(1, "longitude")));
    EXPECT_TRUE(is_null(table.at(0, "label")));
    // Quoted empty string is a value, not null
    EXPECT_EQ(std::get<std::string>(table.at(1, "label")), "");
}

TEST(CsvTest, QuotedFields) {
    std::istringstream in("name,note\r\n"
                          "\"Smith, J\",\"said \"\"hi\"\"\"\r\n"
                          "multi,\"line one\nline two\"\r\n");
    Table table = read_csv(in);

    ASSERT_EQ(table.num_rows(), 2u);
    EXPECT_EQ(std::get<std::string>(table.at(0, "name")), "Smith, J");
    EXPECT_EQ(std::get<std::string>(table.at(0, "note")), "said \"hi\"");
    EXPECT_EQ(std::get<std::string>(table.at(1, "note")), "line one\nline two");
}

TEST(CsvTest, NamedColumnWithTextStaysString) {
    std::istringstream in("latitude,longitude\n"
                          "north,1\n");
    Table table = read_csv(in, {"latitude", "longitude"});

    EXPECT_EQ(table.schema().fields()[0].type, FieldType::STRING);
    EXPECT_EQ(table.schema().fields()[1].type, FieldType::DOUBLE);
    EXPECT_EQ(std::get<std::string>(table.at(0, "latitude")), "north");
}

TEST(CsvTest, RejectsMalformedInput) {
    std::istringstream empty("");
    EXPECT_THROW(read_csv(empty), InvalidArgumentError);

    std::istringstream ragged("a,b\n1,2,3\n");
    EXPECT_THROW(read_csv(ragged), InvalidArgumentError);

    std::istringstream unterminated("a,b\n1,\"open\n");
    EXPECT_THROW(read_csv(unterminated), InvalidArgumentError);

    EXPECT_THROW(read_csv_file("/nonexistent/geoscan/input.csv"), NotFoundError);
}

TEST(CsvTest, WriteQuotesAndNulls) {
    Schema schema({
        Field{"name", FieldType::STRING, true},
        Field{"latitude", FieldType::DOUBLE, true},
        Field{"predicted", FieldType::STRING, true},
    });
    Table table(schema);
    table.add_row({std::string("a,b"), 1.5, std::string("A")});
    table.add_row({std::string("say \"x\""), std::monostate{}, std::monostate{}});

    std::ostringstream out;
    write_csv(table, out);
    EXPECT_EQ(out.str(),
              "name,latitude,predicted\n"
              "\"a,b\",1.5,A\n"
              "\"say \"\"x\"\"\",,\n");
}

TEST(CsvTest, WrittenTableReadsBack) {
    std::istringstream in("latitude,longitude,predicted\n"
                          "0.30000000000000004,-73.98765432109876,north\n"
                          "12,34,\n");
    Table table = read_csv(in, {"latitude", "longitude"});

    std::ostringstream out;
    write_csv(table, out);
    std::istringstream again(out.str());
    Table reread = read_csv(again, {"latitude", "longitude"});

    ASSERT_EQ(reread.num_rows(), table.num_rows());
    for (size_t i = 0; i < table.num_rows(); ++i) {
        EXPECT_EQ(reread.rows()[i], table.rows()[i]) << "row " << i;
    }
}

TEST(CsvTest, PassThroughColumnsAreUnchanged) {
    const std::string text = "zip,latitude,longitude,score\n"
                             "00501,0.1,-73.25,1e3\n"
                             "02134,40.5,12,0.10\n";
    std::istringstream in(text);
    Table table = read_csv(in, {"latitude", "longitude"});

    EXPECT_EQ(std::get<std::string>(table.at(0, "zip")), "00501");
    EXPECT_EQ(std::get<std::string>(table.at(1, "score")), "0.10");

    std::ostringstream out;
    write_csv(table, out);
    EXPECT_EQ(out.str(), text);
}

TEST(CsvTest, DoublesWrittenShortest) {
    EXPECT_EQ(value_to_string(Value(0.1)), "0.1");
    EXPECT_EQ(value_to_string(Value(-73.25)), "-73.25");
    EXPECT_EQ(value_to_string(Value(0.30000000000000004)), "0.30000000000000004");
    EXPECT_EQ(value_to_string(Value(12.0)), "12");
}
