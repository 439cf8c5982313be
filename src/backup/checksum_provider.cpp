#include "backup/checksum_provider.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <filesystem>
#include <fnmatch.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

const char* const kAlgorithmHeader = "# algorithm: ";

bool matchesAny(const std::vector<std::string>& patterns, const std::string& relativePath) {
    const std::string name = fs::path(relativePath).filename().string();
    for (const auto& pattern : patterns) {
        if (fnmatch(pattern.c_str(), relativePath.c_str(), 0) == 0 ||
            fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

class ArtifactLog {
public:
    explicit ArtifactLog(const std::string& path) {
        if (!path.empty()) {
            file_.open(path, std::ios::app);
            if (!file_.is_open()) {
                throw std::runtime_error("Failed to open log file " + path);
            }
        }
    }

    void write(const std::string& line) {
        if (file_.is_open()) {
            file_ << line << std::endl;
        }
    }

private:
    std::ofstream file_;
};

} // namespace

std::string OpenSslChecksumProvider::fileDigest(const std::string& path, const std::string& algorithm) {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (!md) {
        throw std::runtime_error("Unknown hash algorithm: " + algorithm);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Failed to create OpenSSL context");
    }

    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Failed to initialize digest");
    }

    char buffer[65536];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx, buffer, file.gcount()) != 1) {
                EVP_MD_CTX_free(ctx);
                throw std::runtime_error("Failed to update digest");
            }
        }
    }
    if (file.bad()) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Failed to read file: " + path);
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Failed to finalize digest");
    }
    EVP_MD_CTX_free(ctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string OpenSslChecksumProvider::checksumFileName(const std::string& directory,
                                                      const ChecksumOptions& options) {
    const std::string dirname = utils::normalizePath(directory).filename().string();
    const std::string extension = options.forceSingleHash ? options.algorithm : "cshd";
    return dirname + "_bh_" + utils::fileTimestamp() + "." + extension;
}

bool OpenSslChecksumProvider::isSelected(const std::string& relativePath,
                                         const ChecksumOptions& options) {
    if (!options.allowlist.empty()) {
        return matchesAny(options.allowlist, relativePath);
    }
    return !matchesAny(options.blocklist, relativePath);
}

ChecksumFileInfo OpenSslChecksumProvider::createChecksums(const std::string& directory,
                                                          const ChecksumOptions& options,
                                                          const std::string& logFile) {
    if (!EVP_get_digestbyname(options.algorithm.c_str())) {
        throw std::runtime_error("Unknown hash algorithm: " + options.algorithm);
    }
    const fs::path root = utils::normalizePath(directory);
    if (!fs::is_directory(root)) {
        throw std::runtime_error("Source is not a directory: " + root.string());
    }

    const fs::path hashFile = utils::uniqueFilename(root / checksumFileName(directory, options));

    std::vector<std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const std::string relative = entry.path().lexically_relative(root).generic_string();
        if (isSelected(relative, options)) {
            files.push_back(relative);
        }
    }
    std::sort(files.begin(), files.end());

    ArtifactLog log(logFile);
    log.write("Hashing " + root.string() + " with " + options.algorithm);

    std::ofstream out(hashFile);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to create checksum file " + hashFile.string());
    }
    out << kAlgorithmHeader << options.algorithm << "\n";

    ChecksumFileInfo info;
    info.hashFile = hashFile.string();
    try {
        for (const auto& relative : files) {
            out << fileDigest((root / relative).string(), options.algorithm) << "  " << relative << "\n";
            log.write("hashed " + relative);
            info.files++;
        }
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed to write checksum file " + hashFile.string());
        }
    } catch (const std::exception& e) {
        out.close();
        std::error_code ec;
        fs::remove(hashFile, ec);
        log.write(std::string("error: ") + e.what());
        throw;
    }

    log.write("Hashed " + std::to_string(info.files) + " files into " + info.hashFile);
    Logger::debug("Wrote " + info.hashFile + " (" + std::to_string(info.files) + " files)");
    return info;
}

VerifiedInfo OpenSslChecksumProvider::verifyChecksums(const std::string& hashFile,
                                                      const std::string& directory,
                                                      const std::string& logFile) {
    std::ifstream in(hashFile);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open checksum file " + hashFile);
    }

    const fs::path root = utils::normalizePath(directory);
    ArtifactLog log(logFile);
    log.write("Verifying " + root.string() + " against " + hashFile);

    VerifiedInfo info;
    info.logFile = logFile;
    std::string algorithm;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        if (line[0] == '#') {
            if (line.compare(0, std::string(kAlgorithmHeader).size(), kAlgorithmHeader) == 0) {
                algorithm = line.substr(std::string(kAlgorithmHeader).size());
            }
            continue;
        }

        const auto separator = line.find("  ");
        if (separator == std::string::npos || algorithm.empty()) {
            throw std::runtime_error("Malformed checksum file " + hashFile);
        }
        const std::string expected = line.substr(0, separator);
        const std::string relative = line.substr(separator + 2);
        const fs::path file = root / relative;

        info.files++;
        if (!fs::exists(file)) {
            info.missing++;
            log.write("missing: " + relative);
            continue;
        }
        try {
            if (fileDigest(file.string(), algorithm) != expected) {
                info.crcErrors++;
                log.write("checksum mismatch: " + relative);
            }
        } catch (const std::runtime_error& e) {
            info.errors++;
            log.write("error: " + relative + ": " + e.what());
        }
    }

    log.write("Checked " + std::to_string(info.files) + " files, " +
              std::to_string(info.crcErrors) + " checksum mismatches, " +
              std::to_string(info.missing) + " missing, " +
              std::to_string(info.errors) + " errors");
    return info;
}
