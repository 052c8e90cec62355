/**
 * @file ParquetImportService.hpp
 * @brief Imports image/caption rows from a Hub-hosted Parquet file into a dataset directory.
 */

#pragma once

#include "application/RowExtractor.hpp"
#include "domain/ImportOutcome.hpp"
#include "domain/RemoteFetcher.hpp"
#include "domain/TableReader.hpp"
#include "infrastructure/DatasetWriter.hpp"
#include <functional>
#include <memory>
#include <string>

namespace hubingest::application {

/**
 * @class ParquetImportService
 * @brief Orchestrates the pipeline from reference string to written files.
 *
 * The run fails only when the reference, the download, the content check or
 * the decode fails. Per-row problems are collected in the outcome.
 */
class ParquetImportService {
public:
    using StatusCallback = std::function<void(std::string)>;

    /**
     * @param maxNameAttempts Name variants the writer tries per asset.
     */
    ParquetImportService(std::shared_ptr<domain::RemoteFetcher> fetcher,
                         std::shared_ptr<domain::TableReader> reader,
                         int maxNameAttempts = infrastructure::DatasetWriter::kMaxAttempts);

    /**
     * @brief Full pipeline: parse, fetch, validate, decode, extract and write.
     * @param datasetDir Target directory, created when missing.
     * @param reference Free-form Hub reference to a .parquet file.
     * @param token Bearer token as read from settings for this run, may be empty.
     * @param statusCallback Progress feedback.
     * @return summary of the operation.
     * @throws domain::InvalidReference, domain::RemoteFetchError,
     *         domain::InvalidContent, domain::DecodeError
     */
    domain::ImportOutcome importFromHub(const std::string& datasetDir,
                                        const std::string& reference,
                                        const std::string& token,
                                        StatusCallback statusCallback = nullptr);

    /**
     * @brief Row loop over already decoded rows. Never throws for a single row.
     */
    domain::ImportOutcome importRows(const std::string& datasetDir,
                                     domain::TableRows rows,
                                     const RowExtractor::Context& context,
                                     StatusCallback statusCallback = nullptr) const;

private:
    std::shared_ptr<domain::RemoteFetcher> m_fetcher;
    std::shared_ptr<domain::TableReader> m_reader;
    int m_maxNameAttempts;
};

} // namespace hubingest::application
