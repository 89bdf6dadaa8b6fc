#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>

#include "TestSupport.hpp"
#include "application/ExportService.hpp"

using namespace lextable::domain;
using namespace lextable::domain::review;
using namespace lextable::application;

int main() {
    std::cout << "[Test] Starting ExportService Test..." << std::endl;

    assert(ExportService::escapeCsv("plain") == "plain");
    assert(ExportService::escapeCsv("a,b") == "\"a,b\"");
    assert(ExportService::escapeCsv("say \"hi\"") == "\"say \"\"hi\"\"\"");
    assert(ExportService::escapeCsv("line\nbreak") == "\"line\nbreak\"");
    std::cout << "[PASS] RFC 4180 escaping." << std::endl;

    ResultTable table;
    table.job.id = "abc123";
    table.documents = {{"d1", "one.txt"}, {"d2", "two.txt"}};
    table.fields = {{"governing_law", "Governing Law", FieldType::Text}};

    CellRecord found;
    found.documentId = "d1";
    found.documentIdentifier = "one.txt";
    found.value = "Delaware, USA";
    found.valueRaw = "Delaware, USA";
    found.valueNormalized = "Delaware, USA";
    found.reviewState = ReviewState::Extracted;
    found.confidence = 0.95;
    Citation citation;
    citation.location = 2;
    citation.locationType = LocationType::Page;
    citation.charStart = 10;
    citation.charEnd = 23;
    citation.snippet = "laws of \"Delaware, USA\"";
    found.citation = citation;

    CellRecord missing;
    missing.documentId = "d2";
    missing.documentIdentifier = "two.txt";
    missing.reviewState = ReviewState::MissingData;

    ResultRow row;
    row.fieldKey = "governing_law";
    row.fieldLabel = "Governing Law";
    row.fieldType = FieldType::Text;
    row.cells = {found, missing};
    table.rows.push_back(row);

    const std::string csv = ExportService::toCsv(table);
    std::istringstream lines(csv);
    std::string header, first, second, extra;
    std::getline(lines, header);
    std::getline(lines, first);
    std::getline(lines, second);
    assert(!std::getline(lines, extra) || extra.empty());

    assert(header == "field_key,field_label,field_type,document_identifier,value,value_raw,value_normalized,"
                     "review_state,confidence,citation_location,citation_location_type,citation_char_start,"
                     "citation_char_end,citation_snippet\r");
    assert(first == "governing_law,Governing Law,text,one.txt,\"Delaware, USA\",\"Delaware, USA\",\"Delaware, USA\","
                    "EXTRACTED,0.95,2,page,10,23,\"laws of \"\"Delaware, USA\"\"\"\r");
    assert(second == "governing_law,Governing Law,text,two.txt,,,,MISSING_DATA,0,,,,,\r");
    std::cout << "[PASS] CSV rows in table order." << std::endl;

    auto dir = lextable::test::FreshDirectory("lextable_export_test");
    const std::string path = ExportService::writeCsv(table, (dir / "exports").string());
    std::ifstream in(path, std::ios::binary);
    std::stringstream written;
    written << in.rdbuf();
    assert(written.str() == csv);
    assert(path.find("lextable_abc123.csv") != std::string::npos);
    std::filesystem::remove_all(dir);
    std::cout << "[PASS] CSV written to the exports directory." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
