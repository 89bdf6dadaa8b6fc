#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "domain/Identifiers.hpp"
#include "infrastructure/FileSystemDocumentSource.hpp"

using namespace lextable::domain;
using lextable::infrastructure::FileSystemDocumentSource;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting FileSystemDocumentSource Test..." << std::endl;

    auto root = lextable::test::FreshDirectory("lextable_document_source_test");
    const fs::path data = root / "data";
    const fs::path uploads = root / "uploads";
    fs::create_directories(data / "nested");
    fs::create_directories(uploads);

    lextable::test::WriteFile(data / "c_notes.txt", "Plain text contract.");
    lextable::test::WriteFile(data / "a_lease.PDF", "%PDF-1.4 fake");
    lextable::test::WriteFile(data / "b_terms.html", "<p>Terms</p>");
    lextable::test::WriteFile(data / "readme.md", "# not a contract");
    lextable::test::WriteFile(data / "nested" / "deep.txt", "Subdirectories are not scanned.");
    lextable::test::WriteFile(uploads / "0_upload.htm", "<p>Uploaded</p>");

    FileSystemDocumentSource source({data.string(), uploads.string(), (root / "missing").string()});
    std::vector<SourceDocument> docs = source.listDocuments();

    assert(docs.size() == 4 && "Only .pdf, .html/.htm and .txt files directly inside each directory.");
    assert(docs[0].identifier == "a_lease.PDF" && docs[0].format == DocumentFormat::Pdf);
    assert(docs[1].identifier == "b_terms.html" && docs[1].format == DocumentFormat::Html);
    assert(docs[2].identifier == "c_notes.txt" && docs[2].format == DocumentFormat::Text);
    assert(docs[3].identifier == "0_upload.htm" && "Uploads come after the data directory.");
    assert(docs[2].rawBytes == "Plain text contract.");
    std::cout << "[PASS] Directories in order, names sorted, extensions filtered." << std::endl;

    const std::string expectedId = Fnv1a64Hex(fs::absolute(data / "c_notes.txt").lexically_normal().string());
    assert(docs[2].id == expectedId);
    assert(docs[2].id.size() == 16);
    std::vector<SourceDocument> again = FileSystemDocumentSource({data.string(), uploads.string()}).listDocuments();
    assert(again.size() == docs.size());
    for (std::size_t i = 0; i < docs.size(); ++i) {
        assert(again[i].id == docs[i].id && "Ids depend only on the path.");
    }
    assert(docs[0].id != docs[1].id);
    std::cout << "[PASS] Document ids are stable across scans." << std::endl;

    assert(FileSystemDocumentSource::ClassifyByExtension(".HTM") == DocumentFormat::Html);
    assert(!FileSystemDocumentSource::ClassifyByExtension(".docx"));
    assert(!FileSystemDocumentSource::ClassifyByExtension(""));
    std::cout << "[PASS] Extension classification ignores case." << std::endl;

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
