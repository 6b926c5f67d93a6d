#include <hotline/build_id.hpp>
#include <hotline/error.hpp>
#include <hotline/logger.hpp>

#include "../ipc/protocol.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include <unistd.h>

namespace hotline
{

namespace fs = std::filesystem;

namespace
{

// A uniquely named empty file in the system temp directory, removed when the
// object goes out of scope.
class TempFile
{
   public:
    TempFile()
    {
        std::error_code ec;
        auto            dir = fs::temp_directory_path(ec);
        if (ec)
            dir = "/tmp";

        std::string pattern = (dir / "build-id-XXXXXX").string();
        int         fd      = ::mkstemp(pattern.data());
        if (fd < 0)
            throw TransportError(TransportFailure::Sync,
                                 std::string("cannot create temporary build-id file: ")
                                     + std::strerror(errno));
        ::close(fd);
        path_ = pattern;
    }

    ~TempFile()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    TempFile(const TempFile&)            = delete;
    TempFile& operator=(const TempFile&) = delete;

    const fs::path& path() const { return path_; }

   private:
    fs::path path_;
};

}   // namespace

std::string build_id_path(const std::string& app_id)
{
    return ipc::build_id_device_path(app_id);
}

std::string trim_build_id(std::string_view text)
{
    auto is_blank = [](char c) { return static_cast<unsigned char>(c) <= ' '; };

    size_t begin = 0;
    size_t end   = text.size();
    while (begin < end && is_blank(text[begin]))
        ++begin;
    while (end > begin && is_blank(text[end - 1]))
        --end;
    return std::string(text.substr(begin, end - begin));
}

std::optional<std::string> read_build_id_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return std::nullopt;

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        return std::nullopt;
    return trim_build_id(content);
}

bool write_build_id_file(const fs::path& path, std::string_view build_id)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        HOTLINE_LOG_WARN("build-id", "Couldn't open {} for writing", path.string());
        return false;
    }
    out.write(build_id.data(), static_cast<std::streamsize>(build_id.size()));
    out.flush();
    if (!out)
    {
        HOTLINE_LOG_WARN("build-id", "Couldn't write build id file {}", path.string());
        return false;
    }
    return true;
}

void transfer_build_id_to_device(DeviceTransport&   transport,
                                 const std::string& build_id,
                                 const std::string& app_id)
{
    TempFile local;
    if (!write_build_id_file(local.path(), build_id))
        throw TransportError(TransportFailure::Sync,
                             "cannot stage build id in " + local.path().string());

    auto remote = build_id_path(app_id);
    transport.push_file(local.path(), remote);
    HOTLINE_LOG_DEBUG("build-id", "Transferred build id '{}' to {}", build_id, remote);
}

std::optional<std::string> get_device_build_timestamp(DeviceTransport&   transport,
                                                      const std::string& app_id)
{
    TempFile local;
    auto     remote = build_id_path(app_id);

    try
    {
        transport.pull_file(remote, local.path());
    }
    catch (const TransportError& e)
    {
        if (e.kind() != TransportFailure::Sync)
            throw;
        HOTLINE_LOG_DEBUG("build-id", "No build id on device for {}: {}", app_id, e.what());
        return std::nullopt;
    }

    auto content = read_build_id_file(local.path());
    if (!content)
        throw TransportError(TransportFailure::Sync,
                             "cannot read pulled build id from " + local.path().string());
    return content;
}

}   // namespace hotline
