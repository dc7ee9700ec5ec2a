#include "runtime/docker_api_client.hpp"

#include <sys/socket.h>

#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "runtime/stream_demux.hpp"
#include "utils/logging.hpp"

namespace boxrun::runtime {
namespace {

constexpr int kConnectTimeoutS = 5;
constexpr auto kUnboundedRead = std::chrono::hours(24);
constexpr auto kControlRead = std::chrono::seconds(60);

std::unique_ptr<httplib::Client> MakeClient(const std::string& socket_path,
                                            std::chrono::milliseconds read_timeout) {
    auto client = std::make_unique<httplib::Client>(socket_path);
    client->set_address_family(AF_UNIX);
    client->set_default_headers({{"Host", "localhost"}});
    client->set_connection_timeout(kConnectTimeoutS, 0);
    client->set_read_timeout(read_timeout);
    client->set_write_timeout(kControlRead);
    return client;
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string ErrorMessage(const httplib::Response& response) {
    std::string message = response.body;
    const auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
        message = parsed["message"].get<std::string>();
    }
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return std::to_string(response.status) + " " + message;
}

[[noreturn]] void ThrowTransport(const std::string& what, httplib::Error err) {
    const auto kind = err == httplib::Error::Connection
        ? RuntimeError::Kind::kUnreachable
        : RuntimeError::Kind::kApi;
    throw RuntimeError(kind, what + ": " + httplib::to_string(err));
}

[[noreturn]] void ThrowStatus(const std::string& what, const httplib::Response& response) {
    const auto kind = response.status == 404
        ? RuntimeError::Kind::kNotFound
        : RuntimeError::Kind::kApi;
    throw RuntimeError(kind, what + ": " + ErrorMessage(response));
}

}  // namespace

void SplitImageReference(const std::string& image, std::string& repository, std::string& tag) {
    if (image.find('@') != std::string::npos) {
        repository = image;
        tag.clear();
        return;
    }
    const auto slash_pos = image.rfind('/');
    const auto colon_pos = image.rfind(':');
    if (colon_pos != std::string::npos &&
        (slash_pos == std::string::npos || colon_pos > slash_pos)) {
        repository = image.substr(0, colon_pos);
        tag = image.substr(colon_pos + 1);
    } else {
        repository = image;
        tag = "latest";
    }
}

DockerApiClient::DockerApiClient(std::string socket_path, std::string api_version)
    : socket_path_(std::move(socket_path))
    , api_version_(std::move(api_version)) {}

std::string DockerApiClient::Endpoint(const std::string& path) const {
    if (api_version_.empty()) {
        return path;
    }
    return "/" + api_version_ + path;
}

void DockerApiClient::Ping() {
    auto client = MakeClient(socket_path_, kControlRead);
    auto response = client->Get("/_ping");
    if (!response) {
        ThrowTransport("ping " + socket_path_, response.error());
    }
    if (response->status != 200) {
        ThrowStatus("ping", *response);
    }
}

void DockerApiClient::PullImage(const std::string& image) {
    std::string repository;
    std::string tag;
    SplitImageReference(image, repository, tag);
    std::string path = Endpoint("/images/create?fromImage=" + UrlEncode(repository));
    if (!tag.empty()) {
        path += "&tag=" + UrlEncode(tag);
    }

    auto client = MakeClient(socket_path_, kUnboundedRead);
    auto response = client->Post(path, "", "text/plain");
    if (!response) {
        ThrowTransport("pull " + image, response.error());
    }
    if (response->status != 200) {
        ThrowStatus("pull " + image, *response);
    }

    // The progress stream reports failures in-band as {"error": "..."}.
    std::istringstream lines(response->body);
    std::string line;
    while (std::getline(lines, line)) {
        const auto event = nlohmann::json::parse(line, nullptr, false);
        if (event.is_object() && event.contains("error") && event["error"].is_string()) {
            throw RuntimeError(RuntimeError::Kind::kNotFound,
                               "pull " + image + ": " + event["error"].get<std::string>());
        }
    }
}

std::string DockerApiClient::CreateContainer(const ContainerSpec& spec) {
    nlohmann::json host_config = {
        {"Memory", spec.memory_bytes},
        {"NanoCpus", spec.nano_cpus},
        {"CapDrop", spec.cap_drop},
        {"SecurityOpt", spec.security_opt},
        {"AutoRemove", spec.auto_remove}
    };
    nlohmann::json body = {
        {"Image", spec.image},
        {"Cmd", spec.command},
        {"NetworkDisabled", !spec.network_enabled},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"HostConfig", host_config}
    };
    if (!spec.user.empty()) {
        body["User"] = spec.user;
    }
    if (!spec.working_dir.empty()) {
        body["WorkingDir"] = spec.working_dir;
    }
    if (!spec.network_enabled) {
        body["HostConfig"]["NetworkMode"] = "none";
    }

    auto client = MakeClient(socket_path_, kControlRead);
    auto created = client->Post(Endpoint("/containers/create"), body.dump(), "application/json");
    if (!created) {
        ThrowTransport("create container from " + spec.image, created.error());
    }
    if (created->status != 201) {
        ThrowStatus("create container from " + spec.image, *created);
    }
    const auto reply = nlohmann::json::parse(created->body, nullptr, false);
    if (!reply.is_object() || !reply.contains("Id") || !reply["Id"].is_string()) {
        throw RuntimeError(RuntimeError::Kind::kApi, "create container: malformed reply");
    }
    const auto id = reply["Id"].get<std::string>();
    if (reply.contains("Warnings") && reply["Warnings"].is_array()) {
        for (const auto& warning : reply["Warnings"]) {
            if (warning.is_string()) {
                utils::LogWarn("docker", "create warning", {{"id", id.substr(0, 12)},
                                                            {"warning", warning.get<std::string>()}});
            }
        }
    }

    auto started = client->Post(Endpoint("/containers/" + id + "/start"), "", "text/plain");
    if (!started || (started->status != 204 && started->status != 304)) {
        // AutoRemove only applies once the container has run.
        RemoveContainer(id);
        if (!started) {
            ThrowTransport("start container " + id.substr(0, 12), started.error());
        }
        ThrowStatus("start container " + id.substr(0, 12), *started);
    }
    return id;
}

void DockerApiClient::RemoveContainer(const std::string& container_id) {
    auto client = MakeClient(socket_path_, kControlRead);
    auto response = client->Delete(Endpoint("/containers/" + container_id + "?force=true"));
    if (!response) {
        utils::LogWarn("docker", "remove failed", {{"id", container_id.substr(0, 12)},
                                                   {"error", httplib::to_string(response.error())}});
    } else if (response->status != 204 && response->status != 404) {
        utils::LogWarn("docker", "remove failed", {{"id", container_id.substr(0, 12)},
                                                   {"error", ErrorMessage(*response)}});
    }
}

void DockerApiClient::PutArchive(const std::string& container_id,
                                 const std::string& path,
                                 const std::string& archive) {
    auto client = MakeClient(socket_path_, kControlRead);
    auto response = client->Put(
        Endpoint("/containers/" + container_id + "/archive?path=" + UrlEncode(path)),
        archive,
        "application/x-tar");
    if (!response) {
        ThrowTransport("upload archive", response.error());
    }
    if (response->status != 200) {
        ThrowStatus("upload archive", *response);
    }
}

ExecOutput DockerApiClient::Exec(const std::string& container_id,
                                 const std::vector<std::string>& argv,
                                 std::optional<std::chrono::milliseconds> timeout) {
    const nlohmann::json create_body = {
        {"AttachStdin", false},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"Tty", false},
        {"Cmd", argv}
    };
    auto control = MakeClient(socket_path_, kControlRead);
    auto created = control->Post(Endpoint("/containers/" + container_id + "/exec"),
                                 create_body.dump(), "application/json");
    if (!created) {
        ThrowTransport("exec create", created.error());
    }
    if (created->status != 201) {
        ThrowStatus("exec create", *created);
    }
    const auto reply = nlohmann::json::parse(created->body, nullptr, false);
    if (!reply.is_object() || !reply.contains("Id") || !reply["Id"].is_string()) {
        throw RuntimeError(RuntimeError::Kind::kApi, "exec create: malformed reply");
    }
    const auto exec_id = reply["Id"].get<std::string>();

    const nlohmann::json start_body = {{"Detach", false}, {"Tty", false}};
    const auto read_timeout = timeout
        ? *timeout
        : std::chrono::duration_cast<std::chrono::milliseconds>(kUnboundedRead);
    auto stream_client = MakeClient(socket_path_, read_timeout);
    const auto started_at = std::chrono::steady_clock::now();
    auto started = stream_client->Post(Endpoint("/exec/" + exec_id + "/start"),
                                       start_body.dump(), "application/json");
    if (!started) {
        const auto elapsed = std::chrono::steady_clock::now() - started_at;
        if (timeout && started.error() == httplib::Error::Read && elapsed >= *timeout) {
            throw RuntimeError(RuntimeError::Kind::kTimeout,
                               "command exceeded " + std::to_string(timeout->count()) + " ms");
        }
        ThrowTransport("exec start", started.error());
    }
    if (started->status != 200) {
        ThrowStatus("exec start", *started);
    }

    const auto streams = DemuxDockerStream(started->body);
    if (streams.truncated) {
        utils::LogWarn("docker", "exec stream ended mid-frame", {{"exec", exec_id.substr(0, 12)}});
    }

    auto inspected = control->Get(Endpoint("/exec/" + exec_id + "/json"));
    if (!inspected) {
        ThrowTransport("exec inspect", inspected.error());
    }
    if (inspected->status != 200) {
        ThrowStatus("exec inspect", *inspected);
    }
    const auto state = nlohmann::json::parse(inspected->body, nullptr, false);
    ExecOutput output{};
    if (state.is_object() && state.contains("ExitCode") && state["ExitCode"].is_number_integer()) {
        output.exit_code = state["ExitCode"].get<int>();
    }
    output.stdout_bytes = streams.stdout_bytes;
    output.stderr_bytes = streams.stderr_bytes;
    return output;
}

void DockerApiClient::StopContainer(const std::string& container_id,
                                    std::chrono::seconds grace) {
    auto client = MakeClient(socket_path_, grace + std::chrono::seconds(30));
    auto response = client->Post(
        Endpoint("/containers/" + container_id + "/stop?t=" + std::to_string(grace.count())),
        "", "text/plain");
    if (!response) {
        ThrowTransport("stop container " + container_id.substr(0, 12), response.error());
    }
    // 304: already stopped, 404: already reclaimed by AutoRemove.
    if (response->status != 204 && response->status != 304 && response->status != 404) {
        ThrowStatus("stop container " + container_id.substr(0, 12), *response);
    }
}

}  // namespace boxrun::runtime
