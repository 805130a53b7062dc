#include "transfer_receiver.hpp"
#include <string>

#ifndef DOWNLOAD_STORE_HPP
#define DOWNLOAD_STORE_HPP

/*
 * saveReceivedFile() - write a completed transfer into `directory`
 *
 * The directory is created if needed. The remote name goes through
 * sanitizeFileName(), and an existing file is never overwritten:
 * "report.pdf" becomes "report (1).pdf", "report (2).pdf", ...
 *
 * Returns the path written. Throws std::runtime_error on I/O failure.
 */
std::string saveReceivedFile(const std::string& directory, const ReceivedFile& file);

#endif // DOWNLOAD_STORE_HPP
