#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/ParquetImportService.hpp"
#include "domain/ImportErrors.hpp"
#include "infrastructure/ContentDigest.hpp"
#include "infrastructure/HubFetcher.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;
using namespace hubingest::domain;
using hubingest::application::ParquetImportService;
using hubingest::application::RowExtractor;
using hubingest::infrastructure::ContentDigest;
using hubingest::infrastructure::HubFetcher;
using hubingest::test::Bytes;
using hubingest::test::FakeArchive;
using hubingest::test::FakeJpeg;
using hubingest::test::FakePng;
using hubingest::test::LocalHub;
using hubingest::test::ReadText;
using hubingest::test::ScratchDir;

namespace {
    // Hands back prepared rows and remembers the archive it was given.
    class CannedReader : public TableReader {
    public:
        explicit CannedReader(std::vector<TableRow> rows) : m_rows(std::move(rows)) {}

        TableRows read(const std::vector<unsigned char>& archive) override {
            calls++;
            lastArchive = archive;
            return TableRows(m_rows);
        }

        int calls = 0;
        std::vector<unsigned char> lastArchive;

    private:
        std::vector<TableRow> m_rows;
    };

    TableRow Binary(const std::vector<unsigned char>& bytes) {
        return TableRow::binary(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
    }

    std::string AsText(const std::vector<unsigned char>& bytes) {
        return std::string(bytes.begin(), bytes.end());
    }

    size_t CountFiles(const fs::path& dir) {
        size_t n = 0;
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.is_regular_file()) n++;
        }
        return n;
    }

    ParquetImportService Service(const std::vector<TableRow>& rows) {
        return ParquetImportService(std::make_shared<HubFetcher>(), std::make_shared<CannedReader>(rows));
    }

    void TestAllRowsImported() {
        ScratchDir dir("hubingest_rows");
        std::vector<TableRow> rows;
        for (int i = 0; i < 5; ++i) {
            rows.push_back({{"image", {{"bytes", Binary(Bytes("image-" + std::to_string(i)))}}},
                            {"text", "caption " + std::to_string(i)}});
        }
        std::vector<std::string> progress;
        ImportOutcome outcome = Service(rows).importRows(dir.path().string(), TableRows(rows), RowExtractor::Context{},
            [&progress](std::string msg) { progress.push_back(std::move(msg)); });

        assert(outcome.imported == 5);
        assert(outcome.skipped == 0);
        assert(outcome.errors.empty());
        assert(CountFiles(dir.path()) == 10);
        assert(progress.size() == 5 && progress.back() == "Row 5/5");
        std::cout << "[PASS] K rows, K assets" << std::endl;
    }

    void TestRowFaultsAreContained() {
        ScratchDir dir("hubingest_faults");
        std::vector<TableRow> rows = {
            {{"image", {{"bytes", Binary(FakeJpeg())}}}, {"text", "first"}},
            {{"image", {{"bytes", TableRow::array({1, 2, 300})}}}},
            {{"text", "caption without image"}},
            {{"image", nullptr}},
            {{"image", {{"bytes", Binary(FakePng())}, {"path", "x.png"}}}, {"caption", "five"}},
            {{"image", 7}},
        };
        ImportOutcome outcome = Service(rows).importRows(dir.path().string(), TableRows(rows), RowExtractor::Context{});

        assert(outcome.imported == 2);
        assert(outcome.skipped == 2);
        assert(outcome.errors.size() == 2);
        assert(outcome.errors[0].row == 2);
        assert(outcome.errors[1].row == 6);
        assert(ReadText(dir.path() / "x.txt") == "five");

        auto json = outcome.toJson();
        assert(json.dump().rfind("{\"imported\":2,\"skipped\":2,\"errors\":[{\"row\":2,", 0) == 0);
        std::cout << "[PASS] Row faults never abort the run" << std::endl;
    }

    void TestNameCollisionAcrossRows() {
        ScratchDir dir("hubingest_collide");
        std::vector<TableRow> rows = {
            {{"image", {{"bytes", Binary(FakePng())}, {"path", "a/photo 1.png"}}}, {"text", "one"}},
            {{"image", {{"bytes", Binary(FakeJpeg())}, {"path", "b/photo_1.png"}}}, {"text", "two"}},
        };
        ImportOutcome outcome = Service(rows).importRows(dir.path().string(), TableRows(rows), RowExtractor::Context{});
        assert(outcome.imported == 2);
        assert(ReadText(dir.path() / "photo_1.txt") == "one");
        assert(ReadText(dir.path() / "photo_1_1.txt") == "two");
        assert(ReadText(dir.path() / "photo_1_1.png") == AsText(FakeJpeg()));
        std::cout << "[PASS] Colliding names get numbered" << std::endl;
    }

    void TestNameExhaustionIsARowError() {
        ScratchDir dir("hubingest_exhaust");
        { std::ofstream(dir.path() / "a.png") << "taken"; }
        { std::ofstream(dir.path() / "a_1.png") << "taken"; }
        std::vector<TableRow> rows = {
            {{"image", {{"bytes", Binary(FakePng())}, {"path", "b.png"}}}},
            {{"image", {{"bytes", Binary(FakePng())}, {"path", "a.png"}}}},
            {{"image", {{"bytes", Binary(FakePng())}, {"path", "c.png"}}}},
        };
        ParquetImportService service(std::make_shared<HubFetcher>(), std::make_shared<CannedReader>(rows), 2);
        ImportOutcome outcome = service.importRows(dir.path().string(), TableRows(rows), RowExtractor::Context{});

        assert(outcome.imported == 2);
        assert(outcome.errors.size() == 1);
        assert(outcome.errors[0].row == 2);
        assert(outcome.errors[0].error.find("Unable to find a unique filename") != std::string::npos);
        assert(fs::exists(dir.path() / "b.png"));
        assert(fs::exists(dir.path() / "c.png"));
        std::cout << "[PASS] Name exhaustion stays with its row" << std::endl;
    }

    void TestReferencedImagesUseServingNamespace() {
        LocalHub hub;
        const std::string archive = AsText(FakeArchive());
        const std::string dog = AsText(FakePng());
        hub.server().Get("/org/pets/resolve/main/data/train.parquet",
            [archive](const httplib::Request&, httplib::Response& res) {
                res.set_content(archive, "application/octet-stream");
            });
        hub.server().Get("/org/pets/resolve/main/imgs/dog.png",
            [dog](const httplib::Request&, httplib::Response& res) {
                res.set_content(dog, "image/png");
            });
        hub.start();

        std::vector<TableRow> rows;
        rows.push_back({{"image", {{"path", "imgs/dog.png"}}}});
        ParquetImportService service(std::make_shared<HubFetcher>(hub.endpoint()), std::make_shared<CannedReader>(rows));
        ScratchDir dir("hubingest_models");
        ImportOutcome outcome = service.importFromHub(dir.path().string(), "org/pets/data/train.parquet", "");

        assert(outcome.imported == 1);
        assert(ReadText(dir.path() / "dog.png") == dog);

        // The archive lookup walks datasets first; the image lookup does not.
        size_t datasetHitsForImage = 0;
        size_t imageHits = 0;
        for (const auto& hit : hub.hits()) {
            if (hit.path.find("imgs/dog.png") == std::string::npos) continue;
            imageHits++;
            if (hit.path.rfind("/datasets/", 0) == 0) datasetHitsForImage++;
        }
        assert(imageHits == 1);
        assert(datasetHitsForImage == 0);
        std::cout << "[PASS] Referenced images use the namespace that served the archive" << std::endl;
    }

    void TestEndToEndAgainstLocalHub() {
        LocalHub hub;
        const std::string archive = AsText(FakeArchive());
        const std::string dog = AsText(FakePng());
        hub.server().Get("/datasets/org/pets/resolve/main/data/train.parquet",
            [archive](const httplib::Request&, httplib::Response& res) {
                res.set_content(archive, "application/octet-stream");
            });
        hub.server().Get("/datasets/org/pets/resolve/main/imgs/dog.png",
            [dog](const httplib::Request&, httplib::Response& res) {
                res.set_content(dog, "image/png");
            });
        hub.start();

        std::vector<TableRow> rows = {
            {{"image", {{"bytes", Binary(FakeJpeg())}}}, {"caption", "a cat"}},
            {{"image", {{"path", "imgs/dog.png"}}}, {"caption", nullptr}},
        };
        auto reader = std::make_shared<CannedReader>(rows);
        ParquetImportService service(std::make_shared<HubFetcher>(hub.endpoint()), reader);

        ScratchDir dir("hubingest_e2e");
        fs::path target = dir.path() / "pets";
        ImportOutcome outcome = service.importFromHub(target.string(), "org/pets/data/train.parquet", "");

        assert(outcome.imported == 2);
        assert(outcome.skipped == 0);
        assert(outcome.errors.empty());
        assert(reader->calls == 1);
        assert(reader->lastArchive == FakeArchive());

        const std::string md5 = ContentDigest::Md5Hex(FakeJpeg());
        assert(ReadText(target / (md5 + ".jpg")) == AsText(FakeJpeg()));
        assert(ReadText(target / (md5 + ".txt")) == "a cat");
        assert(ReadText(target / "dog.png") == dog);
        assert(fs::exists(target / "dog.txt"));
        assert(ReadText(target / "dog.txt").empty());
        assert(CountFiles(target) == 4);

        for (const auto& hit : hub.hits()) {
            assert(!hit.authenticated);
        }
        std::cout << "[PASS] End-to-end import" << std::endl;
    }

    void TestFatalStagesAbortTheRun() {
        LocalHub hub;
        hub.server().Get("/datasets/org/repo/resolve/main/lfs.parquet",
            [](const httplib::Request&, httplib::Response& res) {
                res.set_content("version https://git-lfs.github.com/spec/v1\noid sha256:abc\nsize 10\n", "text/plain");
            });
        hub.start();

        auto reader = std::make_shared<CannedReader>(std::vector<TableRow>{});
        ParquetImportService service(std::make_shared<HubFetcher>(hub.endpoint()), reader);
        ScratchDir dir("hubingest_fatal");

        bool invalid = false;
        try {
            service.importFromHub(dir.path().string(), "datasets/org/repo/lfs.parquet", "");
        } catch (const InvalidContent& e) {
            invalid = e.pointerDetected();
        }
        assert(invalid);
        assert(reader->calls == 0);

        bool badRef = false;
        try {
            service.importFromHub(dir.path().string(), "org/repo/data.csv", "");
        } catch (const InvalidReference&) {
            badRef = true;
        }
        assert(badRef);

        bool notFound = false;
        try {
            service.importFromHub(dir.path().string(), "datasets/org/repo/absent.parquet", "");
        } catch (const RemoteFetchError& e) {
            notFound = e.attempts().size() == 2;
        }
        assert(notFound);
        assert(CountFiles(dir.path()) == 0);
        std::cout << "[PASS] Fatal stages abort before any write" << std::endl;
    }
}

int main() {
    std::cout << "[Test] Starting ParquetImportService Test..." << std::endl;
    TestAllRowsImported();
    TestRowFaultsAreContained();
    TestNameCollisionAcrossRows();
    TestNameExhaustionIsARowError();
    TestEndToEndAgainstLocalHub();
    TestReferencedImagesUseServingNamespace();
    TestFatalStagesAbortTheRun();
    std::cout << "[PASS] ParquetImportService Test." << std::endl;
    return 0;
}
