#include "firestarter/client/session.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <stdexcept>

#include "firestarter/error_codes.hpp"

namespace firestarter::client
{

    namespace
    {

        std::uint32_t parse_epochs(const std::string &text)
        {
            const auto invalid = [&]()
            { return Error(ErrorCode::InvalidArgument, "Invalid --epochs: " + text); };
            if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
            {
                throw invalid();
            }
            unsigned long long value = 0;
            try
            {
                value = std::stoull(text);
            }
            catch (const std::out_of_range &)
            {
                throw invalid();
            }
            if (value > std::numeric_limits<std::uint32_t>::max())
            {
                throw invalid();
            }
            return static_cast<std::uint32_t>(value);
        }

    } // namespace

    nlohmann::json ClientSession::handle_upload(const CommandArgs &args, const CancellationToken &cancel)
    {
        const std::string usage = "upload <local_path> [remote_name] [--tier T] [--epochs N] [--id ID] [--user U]";
        UploadRequest request;
        request.local_path = std::filesystem::path(args.at(0, usage));
        request.remote_name = args.optional_at(1);
        request.tier = args.option("tier");
        request.upload_id = args.option("id");
        if (const auto epochs = args.option("epochs"))
        {
            request.epochs = parse_epochs(*epochs);
        }

        auto credentials = current_credentials(args);
        return transfers_.upload(credentials, request, cancel);
    }

    nlohmann::json ClientSession::handle_download(const CommandArgs &args, const CancellationToken &cancel)
    {
        DownloadRequest request;
        request.remote_name = args.at(0, "download <remote_name> [output_path] [--user U]");
        request.output_path = args.optional_at(1).value_or("");

        auto credentials = current_credentials(args);
        return transfers_.download(credentials, request, cancel);
    }

    nlohmann::json ClientSession::handle_upload_history(const CommandArgs &args, const CancellationToken &)
    {
        if (const auto user_id = args.optional_at(0))
        {
            return ledger_.read(*user_id);
        }
        return ledger_.read(current_credentials(args).user_id);
    }

    nlohmann::json ClientSession::handle_file_size(const CommandArgs &args, const CancellationToken &)
    {
        const std::filesystem::path path(args.at(0, "file-size <path>"));
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw Error(ErrorCode::NotFound, "Failed to get file size: " + path.string() + ": " + ec.message());
        }
        return static_cast<std::uint64_t>(size);
    }

} // namespace firestarter::client
