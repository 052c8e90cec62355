/**
 * @file ParquetImportService.cpp
 * @brief Implementation of ParquetImportService.
 */

#include "application/ParquetImportService.hpp"
#include "domain/ReferenceParser.hpp"
#include "infrastructure/ContentValidator.hpp"
#include "infrastructure/DatasetWriter.hpp"
#include <filesystem>
#include <iostream>

namespace hubingest::application {

ParquetImportService::ParquetImportService(std::shared_ptr<domain::RemoteFetcher> fetcher,
                                           std::shared_ptr<domain::TableReader> reader,
                                           int maxNameAttempts)
    : m_fetcher(std::move(fetcher)), m_reader(std::move(reader)), m_maxNameAttempts(maxNameAttempts) {}

domain::ImportOutcome ParquetImportService::importFromHub(const std::string& datasetDir,
                                                          const std::string& reference,
                                                          const std::string& token,
                                                          StatusCallback statusCallback) {
    domain::RemoteReference ref = domain::ReferenceParser::Parse(reference);
    std::filesystem::create_directories(datasetDir);

    if (statusCallback) statusCallback("Downloading " + ref.toString() + " (" + domain::RepoKindToString(ref.repoKind) + ")");
    domain::FetchResult fetched = m_fetcher->fetch(ref, token);
    std::cerr << "[ParquetImportService] Downloaded " << fetched.bytes.size() << " bytes from " << fetched.finalUrl << std::endl;

    std::vector<unsigned char> archive = infrastructure::ContentValidator::Validate(fetched);
    fetched.bytes.clear();
    fetched.bytes.shrink_to_fit();

    if (statusCallback) statusCallback("Decoding parquet (" + std::to_string(archive.size()) + " bytes)");
    domain::TableRows rows = m_reader->read(archive);

    RowExtractor::Context context;
    context.source = ref;
    // Referenced images live in the namespace that served the archive.
    if (ref.repoKind == domain::RepoKind::Auto && fetched.repoKind != domain::RepoKind::Auto) {
        context.source->repoKind = fetched.repoKind;
    }
    context.token = token;
    context.fetcher = m_fetcher;
    return importRows(datasetDir, std::move(rows), context, statusCallback);
}

domain::ImportOutcome ParquetImportService::importRows(const std::string& datasetDir,
                                                       domain::TableRows rows,
                                                       const RowExtractor::Context& context,
                                                       StatusCallback statusCallback) const {
    domain::ImportOutcome outcome;
    infrastructure::DatasetWriter writer(datasetDir, m_maxNameAttempts);

    const std::size_t total = rows.size();
    std::size_t rowIndex = 0;
    while (auto row = rows.next()) {
        ++rowIndex;
        if (statusCallback) statusCallback("Row " + std::to_string(rowIndex) + "/" + std::to_string(total));

        domain::RowExtraction extraction = RowExtractor::Extract(*row, rowIndex, context);
        switch (extraction.kind) {
            case domain::RowExtraction::Kind::Skipped:
                outcome.skipped++;
                break;
            case domain::RowExtraction::Kind::Failed:
                outcome.errors.push_back({rowIndex, extraction.message});
                break;
            case domain::RowExtraction::Kind::Asset:
                try {
                    const auto& asset = extraction.asset;
                    writer.write(asset.suggestedBaseName, asset.suggestedExtension, asset.imageBytes, asset.caption);
                    outcome.imported++;
                } catch (const std::exception& e) {
                    std::cerr << "[ParquetImportService] Row " << rowIndex << " write failed: " << e.what() << std::endl;
                    outcome.errors.push_back({rowIndex, e.what()});
                }
                break;
        }
    }

    std::cerr << "[ParquetImportService] Imported " << outcome.imported << ", skipped " << outcome.skipped
              << ", errors " << outcome.errors.size() << " (of " << total << " rows)" << std::endl;
    return outcome;
}

} // namespace hubingest::application
