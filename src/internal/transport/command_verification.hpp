#ifndef MCPCLI_INTERNAL_TRANSPORT_COMMAND_VERIFICATION_HPP
#define MCPCLI_INTERNAL_TRANSPORT_COMMAND_VERIFICATION_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mcpcli::internal
{

/// Compute SHA256 hash of a file
/// Returns hex-encoded SHA256 hash (64 characters) or std::nullopt on error
std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path);

/// Verify a resolved server executable is in the allowlist
/// If allowlist is empty, returns true (no restriction)
bool verify_command_path_allowed(const std::string& command_path,
                                 const std::vector<std::string>& allowed_paths);

/// Verify the executable's SHA256 matches the pinned value
/// If expected_hash is nullopt, returns true (no hash check)
bool verify_command_hash(const std::filesystem::path& command_path,
                         const std::optional<std::string>& expected_hash,
                         std::string& error_message);

} // namespace mcpcli::internal

#endif // MCPCLI_INTERNAL_TRANSPORT_COMMAND_VERIFICATION_HPP
