#include <catch2/catch_test_macros.hpp>

#include "pitwall/ingest/csv_reader.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace pitwall::ingest;

TEST_CASE("CsvReader indexes headers case-insensitively and trims them") {
    std::istringstream in("\xEF\xBB\xBF POSITION ;Number; Laps \n1;78;42\n");
    CsvReader reader(in, ';');
    pitwall::support::Error error;
    REQUIRE(reader.read_header(&error));
    REQUIRE(reader.column("position") == 0);
    REQUIRE(reader.column("NUMBER") == 1);
    REQUIRE(reader.column(" laps ") == 2);
    REQUIRE(reader.column("class") == -1);

    std::vector<std::string> fields;
    REQUIRE(reader.next(&fields));
    REQUIRE(fields == std::vector<std::string>{"1", "78", "42"});
    REQUIRE_FALSE(reader.next(&fields));
}

TEST_CASE("CsvReader handles quotes, escaped quotes and CRLF") {
    std::istringstream in("a,b,c\r\n\"x, y\",\"say \"\"hi\"\"\",3\r\n");
    CsvReader reader(in, ',');
    REQUIRE(reader.read_header(nullptr));

    std::vector<std::string> fields;
    REQUIRE(reader.next(&fields));
    REQUIRE(fields.size() == 3);
    REQUIRE(fields[0] == "x, y");
    REQUIRE(fields[1] == "say \"hi\"");
    REQUIRE(fields[2] == "3");
}

TEST_CASE("CsvReader keeps newlines inside quoted fields") {
    std::istringstream in("name,note\ncar,\"line one\nline two\"\nnext,plain\n");
    CsvReader reader(in, ',');
    REQUIRE(reader.read_header(nullptr));

    std::vector<std::string> fields;
    REQUIRE(reader.next(&fields));
    REQUIRE(fields[1] == "line one\nline two");
    REQUIRE(reader.next(&fields));
    REQUIRE(fields[0] == "next");
    REQUIRE(reader.line_number() == 4);
}

TEST_CASE("CsvReader keeps a quote inside an unquoted field literal") {
    std::istringstream in("name,value\nap\"s,1\"2\nspeed, \"quoted, still\"\nnext,3\n");
    CsvReader reader(in, ',');
    REQUIRE(reader.read_header(nullptr));

    std::vector<std::string> fields;
    REQUIRE(reader.next(&fields));
    REQUIRE(fields == std::vector<std::string>{"ap\"s", "1\"2"});
    REQUIRE(reader.line_number() == 2);
    REQUIRE(reader.next(&fields));
    REQUIRE(fields == std::vector<std::string>{"speed", "quoted, still"});
    REQUIRE(reader.next(&fields));
    REQUIRE(fields == std::vector<std::string>{"next", "3"});
    REQUIRE_FALSE(reader.next(&fields));
}

TEST_CASE("CsvReader skips blank lines") {
    std::istringstream in("\n\na,b\n\n1,2\n ; \n\n3,4\n");
    CsvReader reader(in, ',');
    REQUIRE(reader.read_header(nullptr));
    REQUIRE(reader.header().size() == 2);

    std::vector<std::string> fields;
    std::vector<std::string> firsts;
    while (reader.next(&fields)) firsts.push_back(fields[0]);
    REQUIRE(firsts == std::vector<std::string>{"1", ";", "3"});
}

TEST_CASE("CsvReader reports a missing header") {
    std::istringstream in("\n\n");
    CsvReader reader(in, ',');
    pitwall::support::Error error;
    REQUIRE_FALSE(reader.read_header(&error));
    REQUIRE(error.kind == pitwall::support::ErrorKind::Parse);
}

TEST_CASE("field_or_empty tolerates short rows and absent columns") {
    const std::vector<std::string> fields{"a"};
    REQUIRE(field_or_empty(fields, 0) == "a");
    REQUIRE(field_or_empty(fields, 3).empty());
    REQUIRE(field_or_empty(fields, -1).empty());
}
