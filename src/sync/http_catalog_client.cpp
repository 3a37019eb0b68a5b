#include <shelf/sync/catalog_client.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <unordered_set>

namespace shelf::sync {

using json = nlohmann::json;

namespace {

Error invalid(const std::string& what) {
    return Error{ErrorCode::InvalidData, what};
}

std::string urlEncode(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string stringOr(const json& obj, const char* key, std::string fallback = {}) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return fallback;
    return it->get<std::string>();
}

Result<manifest::FileRecord> parseFile(const json& j, const std::string& itemId) {
    manifest::FileRecord f;
    f.name = stringOr(j, "name");
    f.url = stringOr(j, "url");
    f.os = stringOr(j, "os");
    f.lang = stringOr(j, "lang");

    if (auto it = j.find("size"); it != j.end() && !it->is_null()) {
        if (!it->is_number_unsigned() && !it->is_number_integer())
            return invalid(itemId + "/" + f.name + ": size is not an integer");
        if (it->is_number_integer() && it->get<long long>() < 0)
            return invalid(itemId + "/" + f.name + ": negative size");
        f.size = it->get<std::uint64_t>();
    }

    if (auto it = j.find("md5"); it != j.end() && !it->is_null()) {
        if (!it->is_string())
            return invalid(itemId + "/" + f.name + ": md5 is not a string");
        const auto text = it->get<std::string>();
        if (!text.empty()) {
            auto sum = crypto::Checksum::parse(text);
            if (!sum)
                return invalid(itemId + "/" + f.name + ": malformed md5 '" + text + "'");
            f.checksum = std::move(*sum);
        }
    }

    const auto kind = stringOr(j, "kind", "installer");
    auto parsed = manifest::parseKind(kind);
    if (!parsed)
        return invalid(itemId + "/" + f.name + ": unknown kind '" + kind + "'");
    f.kind = *parsed;

    if (auto it = j.find("updated"); it != j.end() && it->is_boolean())
        f.updated = it->get<bool>();
    return f;
}

} // namespace

Error classifyCatalogStatus(long status, const std::string& url, bool notFoundIsUnknownItem) {
    const auto where = "GET " + url + " -> HTTP " + std::to_string(status);
    if (status == 401 || status == 403)
        return Error{ErrorCode::AuthExpired, where + "; session expired, log in again"};
    if (status == 404 && notFoundIsUnknownItem)
        return Error{ErrorCode::UnknownItem, where};
    if (net::isServerErrorStatus(status) || status == 429)
        return Error{ErrorCode::TransientNetworkError, where};
    return Error{ErrorCode::HttpError, where};
}

Result<CatalogPage> parseCatalogPage(std::string_view text) {
    json j = json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return invalid("catalog page is not a JSON object");

    auto items = j.find("items");
    if (items == j.end() || !items->is_array())
        return invalid("catalog page lacks an 'items' array");

    CatalogPage page;
    for (const auto& row : *items) {
        if (!row.is_object())
            return invalid("catalog row is not an object");
        CatalogEntry e;
        e.id = stringOr(row, "id");
        if (e.id.empty())
            return invalid("catalog row without an id");
        if (auto u = row.find("updated"); u != row.end() && u->is_boolean())
            e.updated = u->get<bool>();
        page.entries.push_back(std::move(e));
    }
    if (auto p = j.find("page"); p != j.end() && p->is_number_integer())
        page.page = p->get<int>();
    if (auto t = j.find("total_pages"); t != j.end() && t->is_number_integer())
        page.totalPages = t->get<int>();
    return page;
}

Result<manifest::Item> parseItemDetail(std::string_view text) {
    json j = json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return invalid("item detail is not a JSON object");

    manifest::Item item;
    item.id = stringOr(j, "id");
    if (item.id.empty())
        return invalid("item detail without an id");
    if (!manifest::isSafePathComponent(item.id))
        return invalid("item id '" + item.id + "' is not usable as a directory name");
    item.title = stringOr(j, "title", item.id);
    item.notes = stringOr(j, "notes");
    item.serial = stringOr(j, "serial");

    auto files = j.find("files");
    if (files == j.end() || files->is_null())
        return item;
    if (!files->is_array())
        return invalid(item.id + ": 'files' is not an array");

    std::unordered_set<std::string> seen;
    for (const auto& row : *files) {
        if (!row.is_object())
            return invalid(item.id + ": file entry is not an object");
        auto f = parseFile(row, item.id);
        if (!f)
            return f.error();
        auto file = std::move(f).value();
        if (file.name.empty()) {
            spdlog::warn("{}: dropping file entry without a name (url '{}')", item.id, file.url);
            continue;
        }
        if (!manifest::isSafePathComponent(file.name))
            return invalid(item.id + ": file name '" + file.name + "' is not a plain file name");
        // The service occasionally lists the same file twice; first wins
        if (!seen.insert(file.name).second) {
            spdlog::debug("{}: duplicate file '{}' ignored", item.id, file.name);
            continue;
        }
        item.files.push_back(std::move(file));
    }
    return item;
}

HttpCatalogClient::HttpCatalogClient(net::IHttpAdapter& http,
                                     std::chrono::milliseconds requestDelay, Sleeper sleeper)
    : http_(http), requestDelay_(requestDelay), sleeper_(std::move(sleeper)) {}

Result<std::string> HttpCatalogClient::getJson(const net::SessionContext& session,
                                               const std::string& url,
                                               bool notFoundIsUnknownItem) {
    if (sleeper_)
        sleeper_(requestDelay_);

    std::string body;
    auto res = net::fetchText(http_, session.request(url), body);
    if (!res)
        return res.error();
    if (!net::isSuccessStatus(res.value().status))
        return classifyCatalogStatus(res.value().status, url, notFoundIsUnknownItem);
    return body;
}

Result<std::vector<CatalogEntry>> HttpCatalogClient::enumerate(const net::SessionContext& session) {
    std::vector<CatalogEntry> out;
    std::unordered_set<std::string> seen;

    for (int page = 1;; ++page) {
        const auto url = session.baseUrl + "/catalog?page=" + std::to_string(page);
        auto body = getJson(session, url, false);
        if (!body)
            return body.error();

        auto parsed = parseCatalogPage(body.value());
        if (!parsed)
            return Error{parsed.error().code, url + ": " + parsed.error().message};

        const auto& p = parsed.value();
        spdlog::debug("catalog page {}/{}: {} item(s)", page, p.totalPages, p.entries.size());
        for (const auto& e : p.entries) {
            if (seen.insert(e.id).second)
                out.push_back(e);
        }
        if (p.entries.empty() || page >= p.totalPages)
            break;
    }
    return out;
}

Result<manifest::Item> HttpCatalogClient::fetchDetail(const net::SessionContext& session,
                                                      const std::string& id) {
    const auto url = session.baseUrl + "/catalog/items/" + urlEncode(id);
    auto body = getJson(session, url, true);
    if (!body)
        return body.error();

    auto item = parseItemDetail(body.value());
    if (!item)
        return Error{item.error().code, url + ": " + item.error().message};
    if (item.value().id != id)
        return invalid(url + ": detail is for '" + item.value().id + "'");
    return item;
}

} // namespace shelf::sync
