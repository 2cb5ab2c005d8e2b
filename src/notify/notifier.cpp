#include "notifier.hpp"
#include <core/log.hpp>
#include <curl/curl.h>
#include <json/json.h>
#include <fmt/format.h>
#include <mutex>

// Response bodies are only logged, never parsed
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

static void curl_global_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

bool should_notify(NotifyWhen when, const RunReport& report) {
    switch (when) {
        case NotifyWhen::Always:  return true;
        case NotifyWhen::Failure: return report.overall_status != RunStatus::Success;
        case NotifyWhen::Never:   return false;
    }
    return false;
}

Json::Value report_to_json(const RunReport& report) {
    Json::Value root;
    root["run_id"] = report.run_id;
    root["started_at"] = report.started_at;
    root["finished_at"] = report.finished_at;
    root["elapsed_ms"] = Json::Int64(report.elapsed.count());
    root["overall_status"] = run_status_name(report.overall_status);

    Json::Value totals;
    totals["jobs"] = Json::UInt64(report.results.size());
    totals["succeeded"] = Json::UInt64(report.count(TransferStatus::Success));
    totals["failed"] = Json::UInt64(report.count(TransferStatus::Failed));
    totals["skipped"] = Json::UInt64(report.count(TransferStatus::Skipped));
    totals["bytes"] = Json::UInt64(report.total_bytes());
    root["totals"] = totals;

    Json::Value results(Json::arrayValue);
    for (size_t i = 0; i < report.results.size(); i++) {
        const auto& r = report.results[i];
        Json::Value item;
        item["job_id"] = r.job_id;
        if (i < report.jobs.size()) {
            item["source"] = report.jobs[i].source_path;
            item["host"] = report.jobs[i].dest_host_id;
            item["dest"] = report.jobs[i].dest_path;
        }
        item["status"] = transfer_status_name(r.status);
        item["bytes"] = Json::UInt64(r.bytes_transferred);
        item["elapsed_ms"] = Json::Int64(r.elapsed.count());
        item["attempts"] = r.attempts;
        item["reused"] = r.reused;
        if (!r.ok()) {
            item["error_kind"] = error_kind_name(r.error_kind);
            item["error"] = r.error;
        }
        results.append(item);
    }
    root["results"] = results;
    return root;
}

std::string report_to_json_string(const RunReport& report) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, report_to_json(report));
}

WebhookNotifier::WebhookNotifier(const NotifySettings& settings) : settings_(settings) {
}

Result<void> WebhookNotifier::notify(const RunReport& report) {
    if (settings_.webhook_url.empty()) {
        return Result<void>::Err("No webhook URL configured");
    }

    curl_global_once();
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Result<void>::Err("Failed to initialize CURL");
    }

    std::string payload = report_to_json_string(report);
    std::string response;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, settings_.webhook_url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(settings_.timeout > 0 ? settings_.timeout : 10));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return Result<void>::Err(fmt::format("Failed to send webhook: {}", curl_easy_strerror(res)));
    }

    plexmover_log(fmt::format("webhook {} -> HTTP {} {}", report.run_id, http_code, response.substr(0, 200)));
    if (http_code < 200 || http_code >= 300) {
        return Result<void>::Err(fmt::format("Webhook returned HTTP {}", http_code));
    }
    return Result<void>::Ok();
}
