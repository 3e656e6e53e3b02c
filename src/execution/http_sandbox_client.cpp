#include "execution/http_sandbox_client.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <memory>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

// 通信时除了运行本身以外的操作的时间限制
static const long REQUEST_TIMEOUT_MS = 30000;

static size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

static int check_cancelled(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto token = static_cast<cancellation_token *>(userdata);
    return token && token->is_cancelled() ? 1 : 0;
}

static bool is_success(long status) {
    return status >= 200 && status < 300;
}

http_sandbox_client::http_sandbox_client(string base_url, string api_key, string template_name, string workdir)
    : base_url(move(base_url)), api_key(move(api_key)), template_name(move(template_name)), workdir(move(workdir)) {
    while (!this->base_url.empty() && this->base_url.back() == '/') this->base_url.pop_back();
}

http_sandbox_client::response http_sandbox_client::send(const string &method, const string &path, const json *body, long timeout_ms, const shared_ptr<cancellation_token> &token) {
    unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw transport_failure("unable to initialize curl");

    struct curl_slist *raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
    if (!api_key.empty())
        raw_headers = curl_slist_append(raw_headers, ("X-API-Key: " + api_key).c_str());
    unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers, curl_slist_free_all);

    string url = base_url + path;
    string payload = body ? dump_lossy(*body) : string();
    response res;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    if (body) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, (long)payload.size());
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &res.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, check_cancelled);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, token.get());

    CURLcode code = curl_easy_perform(curl.get());
    if (code == CURLE_ABORTED_BY_CALLBACK)
        throw execution_canceled(fmt::format("{} {} was canceled", method, path));
    if (code != CURLE_OK)
        throw transport_failure(fmt::format("{} {} failed: {}", method, url, curl_easy_strerror(code)));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status);
    DLOG(INFO) << method << ' ' << url << " -> " << res.status;
    return res;
}

string http_sandbox_client::create(int timeout_ms, const shared_ptr<cancellation_token> &token) {
    json body = {{"template", template_name}, {"timeoutMs", timeout_ms}};
    response res;
    try {
        res = send("POST", "/sandboxes", &body, REQUEST_TIMEOUT_MS, token);
    } catch (transport_failure &ex) {
        throw provisioning_error(ex.what(), true);
    }

    if (res.status == 429 || res.status >= 500)
        throw provisioning_error(fmt::format("Sandbox service unavailable (HTTP {}): {}", res.status, truncate_text(res.body, 512)), true);
    if (!is_success(res.status))
        throw provisioning_error(fmt::format("Sandbox service rejected the request (HTTP {}): {}", res.status, truncate_text(res.body, 512)), false);

    try {
        return get_value<string>(json::parse(res.body), "sandboxId");
    } catch (std::exception &ex) {
        throw provisioning_error(fmt::format("Malformed sandbox creation response: {}", ex.what()), false);
    }
}

void http_sandbox_client::write_files(const string &sandbox_id, const vector<project_file> &files, const shared_ptr<cancellation_token> &token) {
    json body = {{"files", files}};
    response res = send("POST", "/sandboxes/" + sandbox_id + "/files", &body, REQUEST_TIMEOUT_MS, token);
    if (!is_success(res.status))
        throw transport_failure(fmt::format("Unable to upload files to sandbox {} (HTTP {}): {}", sandbox_id, res.status, truncate_text(res.body, 512)));
}

sandbox_run_result http_sandbox_client::run(const string &sandbox_id, const string &entry_point, int timeout_ms, const shared_ptr<cancellation_token> &token) {
    json body = {{"entryPoint", workdir + "/" + entry_point}, {"cwd", workdir}, {"timeoutMs", timeout_ms}};
    // 运行时间由沙箱服务限制，这里多等待一段时间以便收到沙箱服务的超时响应
    response res = send("POST", "/sandboxes/" + sandbox_id + "/run", &body, timeout_ms + TEARDOWN_GRACE_MS, token);
    if (!is_success(res.status))
        throw transport_failure(fmt::format("Unable to run in sandbox {} (HTTP {}): {}", sandbox_id, res.status, truncate_text(res.body, 512)));

    try {
        json j = json::parse(res.body);
        sandbox_run_result result;
        result.stdout_text = get_value_def<string>(j, "", "stdout");
        result.stderr_text = get_value_def<string>(j, "", "stderr");
        result.exit_code = get_value_def<int>(j, 0, "exitCode");
        result.timed_out = get_value_def<bool>(j, false, "timedOut");
        if (exists(j, "error")) result.error = get_value<string>(j, "error");
        return result;
    } catch (std::exception &ex) {
        throw transport_failure(fmt::format("Malformed run response from sandbox {}: {}", sandbox_id, ex.what()));
    }
}

void http_sandbox_client::kill(const string &sandbox_id) {
    response res = send("DELETE", "/sandboxes/" + sandbox_id, nullptr, REQUEST_TIMEOUT_MS, nullptr);
    // 沙箱已经被服务端回收时返回 404
    if (!is_success(res.status) && res.status != 404)
        throw transport_failure(fmt::format("Unable to kill sandbox {} (HTTP {})", sandbox_id, res.status));
}

}  // namespace runner
