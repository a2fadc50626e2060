#include "progress_parser.hpp"
#include <cmath>
#include <cstdio>
#include <regex>
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>

#include "logger.hpp"
#include "time_utils.hpp"

using json = nlohmann::json;

namespace progress {

namespace {

AnnexAction action_from(const json& j) {
    AnnexAction a;
    a.command = j.value("command", "");
    a.note = j.value("note", "");
    a.success = j.value("success", false);
    a.key = j.value("key", "");
    a.file = j.value("file", "");
    return a;
}

bool has_any(const json& j, std::initializer_list<const char*> keys) {
    for (const char* k : keys)
        if (j.contains(k))
            return true;
    return false;
}

std::int64_t int_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end())
        return 0;
    if (it->is_number())
        return it->get<std::int64_t>();
    if (it->is_string()) {
        // Some git-annex versions quote byte counts.
        try {
            return std::stoll(it->get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

} // namespace

AnnexRecord decode_annex_line(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        return Unparseable{line, e.what()};
    }
    if (!j.is_object())
        return Unparseable{line, "not a JSON object"};
    try {
        if (has_any(j, {"byte-progress", "percent-progress", "total-size"}) ||
            (j.contains("action") && j["action"].is_object())) {
            AnnexProgress p;
            if (j.contains("action") && j["action"].is_object())
                p.action = action_from(j["action"]);
            p.byte_progress = int_field(j, "byte-progress");
            p.total_size = int_field(j, "total-size");
            p.percent = j.value("percent-progress", "");
            return p;
        }
        if (has_any(j, {"command", "note", "success", "key", "file"}))
            return action_from(j);
    } catch (const json::exception& e) {
        return Unparseable{line, e.what()};
    }
    return Unparseable{line, "unknown record"};
}

std::string format_ibytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    char buf[32];
    if (bytes < 10) {
        std::snprintf(buf, sizeof(buf), "%d B", static_cast<int>(bytes));
        return buf;
    }
    double scaled = static_cast<double>(bytes);
    int e = 0;
    while (scaled >= 1024.0 && e < 6) {
        scaled /= 1024.0;
        ++e;
    }
    double val = std::floor(scaled * 10 + 0.5) / 10;
    std::snprintf(buf, sizeof(buf), val < 10 ? "%.1f %s" : "%.0f %s", val, units[e]);
    return buf;
}

std::string calc_rate(std::int64_t dbytes, std::chrono::nanoseconds dt) {
    if (dt.count() <= 0 || dbytes <= 0)
        return "";
    long double rate = static_cast<long double>(dbytes) * 1e9L / dt.count();
    return format_ibytes(static_cast<std::uint64_t>(rate)) + "/s";
}

std::string RateTracker::update(const std::string& item, std::int64_t bytes,
                                clock::time_point now) {
    std::string rate;
    if (have_prev_ && item == item_)
        rate = calc_rate(bytes - prev_bytes_, now - prev_time_);
    item_ = item;
    prev_bytes_ = bytes;
    prev_time_ = now;
    have_prev_ = true;
    return rate;
}

std::optional<TextProgress> parse_push_line(const std::string& line, const std::string& remote) {
    static const std::regex re(
        R"((Compressing|Writing) objects:\s+([0-9]{2,3})% \(([0-9]+)/([0-9]+)\))");
    std::smatch m;
    if (!std::regex_search(line, m, re))
        return std::nullopt;
    TextProgress p;
    p.state = m[1].str();
    if (p.state == "Writing")
        p.state = "Uploading git files (to: " + remote + ")";
    p.percent = m[2].str() + "%";
    return p;
}

std::optional<TextProgress> parse_clone_line(const std::string& line) {
    if (line.rfind("Receiving objects", 0) != 0)
        return std::nullopt;
    std::istringstream in(line);
    std::vector<std::string> words;
    std::string w;
    while (in >> w)
        words.push_back(w);
    TextProgress p;
    p.state = "Downloading repository";
    if (words.size() > 2)
        p.percent = words[2];
    if (words.size() > 8) {
        p.rate = words[7] + words[8];
        if (!p.rate.empty() && p.rate.back() == ',')
            p.rate.pop_back();
    }
    return p;
}

std::string transfer_failure(const std::string& note) {
    std::string msg = note;
    if (msg.find("Unable to access") != std::string::npos)
        msg = "authorisation failed or remote storage unavailable";
    return "failed: " + msg;
}

std::string metadata_display_name(const std::string& metadata_json) {
    json j = json::parse(metadata_json, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return "";
    auto first = [&](const char* field) -> std::string {
        if (!j.contains("fields") || !j["fields"].is_object())
            return "";
        const json& f = j["fields"];
        auto it = f.find(field);
        if (it == f.end() || !it->is_array() || it->empty() || !(*it)[0].is_string())
            return "";
        return (*it)[0].get<std::string>();
    };
    std::string name = first("annexsync-filename");
    if (name.empty())
        return j.value("file", "");
    std::string when = annex_time_display(first("annexsync-filename-lastchanged"));
    if (when.empty())
        return name;
    return name + " (version: " + when + ")";
}

std::string KeyNameResolver::name_for(const std::string& key) {
    auto it = cache_.find(key);
    if (it != cache_.end())
        return it->second;
    ++lookups_;
    std::string name = lookup_ ? lookup_(key) : "";
    if (name.empty())
        name = "(unknown)";
    cache_.emplace(key, name);
    return name;
}

AnnexEventParser::AnnexEventParser(std::string state, std::string raw_input, FailureText failure,
                                   KeyNameResolver* names)
    : state_(std::move(state)), raw_input_(std::move(raw_input)), failure_(std::move(failure)),
      names_(names) {
    if (!failure_)
        failure_ = [](const AnnexAction& a) { return transfer_failure(a.note); };
}

std::string AnnexEventParser::display_name(const AnnexAction& a) {
    if (!a.file.empty())
        return a.file;
    if (names_ == nullptr || a.key.empty())
        return "";
    if (a.key != current_key_) {
        current_key_ = a.key;
        current_name_ = names_->name_for(a.key);
    }
    return current_name_;
}

std::optional<StatusEvent> AnnexEventParser::feed(const std::string& line,
                                                  RateTracker::clock::time_point now) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos)
        return std::nullopt;
    AnnexRecord rec = decode_annex_line(line);
    StatusEvent ev;
    ev.state = state_;
    ev.raw_input = raw_input_;
    ev.raw_output = line;
    if (auto* u = std::get_if<Unparseable>(&rec)) {
        ++skipped_;
        log_warning("Could not parse git-annex output",
                    LogFields{{"line", u->line}, {"error", u->reason}});
        return std::nullopt;
    }
    if (auto* p = std::get_if<AnnexProgress>(&rec)) {
        ev.file_name = display_name(p->action);
        ev.progress = p->percent;
        std::string item = p->action.key.empty() ? p->action.file : p->action.key;
        ev.rate = rate_.update(item, p->byte_progress, now);
    } else {
        const auto& a = std::get<AnnexAction>(rec);
        ev.file_name = display_name(a);
        ev.progress = kComplete;
        if (!a.success) {
            ev.error =
                errors::Failure{errors::Category::ItemFailure, failure_(a), {ev.file_name}, a.note};
        }
    }
    if (ev.file_name.empty())
        return std::nullopt;
    return ev;
}

} // namespace progress
