#include <shelf/net/http.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace shelf::net {

using json = nlohmann::json;

HttpRequest SessionContext::request(std::string url) const {
    HttpRequest req;
    req.url = std::move(url);
    req.headers = headers;
    req.timeout = timeout;
    req.tls = tls;
    req.proxy = proxy;
    req.userAgent = userAgent;
    return req;
}

Result<HttpResult> fetchText(IHttpAdapter& http, const HttpRequest& request, std::string& body,
                             const ShouldCancel& shouldCancel) {
    body.clear();
    BodySink sink = [&body](long, std::span<const std::byte> data) -> Result<void> {
        body.append(reinterpret_cast<const char*>(data.data()), data.size());
        return {};
    };
    return http.get(request, sink, shouldCancel);
}

Result<SessionContext> loadSession(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::AuthExpired,
                     "no session file at " + path.string() + "; log in first"};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FilesystemError, "cannot open session file " + path.string()};
    }
    std::stringstream ss;
    ss << in.rdbuf();

    json j = json::parse(ss.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error{ErrorCode::InvalidData, "session file is not a JSON object: " + path.string()};
    }

    SessionContext ctx;
    auto it = j.find("base_url");
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
        return Error{ErrorCode::InvalidData, "session file lacks base_url: " + path.string()};
    }
    ctx.baseUrl = it->get<std::string>();
    while (!ctx.baseUrl.empty() && ctx.baseUrl.back() == '/')
        ctx.baseUrl.pop_back();

    if (auto h = j.find("headers"); h != j.end()) {
        if (!h->is_object()) {
            return Error{ErrorCode::InvalidData, "session headers must be an object"};
        }
        for (const auto& [name, value] : h->items()) {
            if (!value.is_string()) {
                return Error{ErrorCode::InvalidData, "session header '" + name + "' is not a string"};
            }
            ctx.headers.push_back(Header{name, value.get<std::string>()});
        }
    }
    if (auto ua = j.find("user_agent"); ua != j.end() && ua->is_string()) {
        ctx.userAgent = ua->get<std::string>();
    }

    spdlog::debug("Loaded session for {} ({} header(s))", ctx.baseUrl, ctx.headers.size());
    return ctx;
}

} // namespace shelf::net
