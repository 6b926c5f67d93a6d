#pragma once

#include <hotline/device.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace hotline
{

// Device path the build identifier of `app_id` is stored at.
std::string build_id_path(const std::string& app_id);

// Push `build_id` to the device through a temporary local file. The temporary
// file is removed on every path; transport failures propagate.
void transfer_build_id_to_device(DeviceTransport&   transport,
                                 const std::string& build_id,
                                 const std::string& app_id);

// Build identifier currently on the device, trimmed. std::nullopt when the
// device holds none; any other transport failure propagates.
std::optional<std::string> get_device_build_timestamp(DeviceTransport&   transport,
                                                      const std::string& app_id);

// Local helpers. Reading returns the trimmed content, std::nullopt if the
// file cannot be opened; writing returns false on any I/O error.
std::optional<std::string> read_build_id_file(const std::filesystem::path& path);
bool write_build_id_file(const std::filesystem::path& path, std::string_view build_id);

// Strips leading and trailing whitespace and control characters.
std::string trim_build_id(std::string_view text);

}   // namespace hotline
