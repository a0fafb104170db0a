#include "metrics/prometheus_exporter.h"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace cqr::metrics {

namespace {

std::string escape_label_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string render_labels(const Labels& labels) {
    if (labels.empty()) return "";
    std::string out = "{";
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) out.push_back(',');
        out += labels[i].first + "=\"" + escape_label_value(labels[i].second) + "\"";
    }
    out.push_back('}');
    return out;
}

}  // namespace

PrometheusExporter::Series& PrometheusExporter::series_locked(const std::string& name,
                                                              const char* type,
                                                              const std::string& help,
                                                              const Labels& labels) {
    auto fam = std::find_if(families_.begin(), families_.end(),
                            [&](const Family& f) { return f.name == name; });
    if (fam == families_.end()) {
        families_.push_back(Family{name, help, type, {}});
        fam = std::prev(families_.end());
    } else if (!help.empty()) {
        fam->help = help;
    }

    const std::string key = render_labels(labels);
    auto it = std::find_if(fam->series.begin(), fam->series.end(),
                           [&](const Series& s) { return s.labels == key; });
    if (it == fam->series.end()) {
        fam->series.push_back(Series{key, 0.0, 0.0});
        return fam->series.back();
    }
    return *it;
}

void PrometheusExporter::set_gauge(const std::string& name, double value, const std::string& help) {
    std::lock_guard<std::mutex> lk(mu_);
    series_locked(name, "gauge", help, {}).value = value;
}

void PrometheusExporter::inc_counter(const std::string& name, double delta, const std::string& help,
                                     const Labels& labels) {
    std::lock_guard<std::mutex> lk(mu_);
    series_locked(name, "counter", help, labels).value += delta;
}

void PrometheusExporter::observe(const std::string& name, double value, const std::string& help,
                                 const Labels& labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& s = series_locked(name, "summary", help, labels);
    s.value += value;
    s.count += 1.0;
}

double PrometheusExporter::value(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string key = render_labels(labels);
    for (const auto& f : families_) {
        if (f.name != name) continue;
        for (const auto& s : f.series) {
            if (s.labels == key) return s.value;
        }
    }
    return 0.0;
}

std::string PrometheusExporter::render() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;
    for (const auto& f : families_) {
        if (!f.help.empty()) {
            oss << "# HELP " << f.name << " " << f.help << "\n";
        }
        oss << "# TYPE " << f.name << " " << f.type << "\n";
        for (const auto& s : f.series) {
            if (f.type == "summary") {
                oss << f.name << "_sum" << s.labels << " " << s.value << "\n";
                oss << f.name << "_count" << s.labels << " " << s.count << "\n";
            } else {
                oss << f.name << s.labels << " " << s.value << "\n";
            }
        }
    }
    return oss.str();
}

}  // namespace cqr::metrics
