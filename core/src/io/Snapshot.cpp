#include "io/Snapshot.h"
#include "io/ConfigOptions.h"
#include "kernel/StateMachine.h"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

std::string kernelToJson(const Kernel& kernel, bool includeAgents) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    const auto m = kernel.computeMetrics();

    os << "{";
    os << "\"generation\":" << kernel.generation() << ",";
    os << "\"metrics\":{";
    for (std::size_t k = 0; k < kStatusCount; ++k) {
        const auto s = static_cast<LegalStatus>(k);
        os << "\"share_" << statusName(s) << "\":" << m.share(s) << ",";
    }
    os << "\"edges\":" << m.edge_count;
    if (!kernel.metrics().empty()) {
        const auto& last = kernel.metrics().back();
        os << ",\"crime_events\":" << last.crime_events
           << ",\"detentions\":" << last.arrests
           << ",\"wrongful_detentions\":" << last.wrongful_detentions
           << ",\"convictions\":" << last.convictions
           << ",\"releases\":" << last.releases();
    }
    os << "}";

    if (includeAgents) {
        os << ",\"agents\":[";
        const auto& agents = kernel.agents();
        for (std::size_t i = 0; i < agents.size(); ++i) {
            const auto& a = agents[i];
            os << "{";
            os << "\"id\":" << a.id << ",";
            os << "\"status\":\"" << statusName(a.status) << "\",";
            os << "\"propensity\":" << a.base_propensity << ",";
            os << "\"stigma\":" << a.stigma << ",";
            os << "\"capital\":" << a.criminal_capital << ",";
            os << "\"window_crimes\":" << a.crime_history.count() << ",";
            os << "\"remaining\":" << a.remaining_days << ",";
            os << "\"degree\":" << kernel.network().degree(a.id);
            os << "}";
            if (i + 1 < agents.size()) os << ",";
        }
        os << "]";
    }
    os << "}";

    return os.str();
}

std::string metricsCsvHeader() {
    return "day,crime_events,detentions,wrongful_detentions,detention_exits,convictions,"
           "releases,share_lawful,share_at_risk,share_criminal,share_detained,share_prison,edges";
}

void logMetrics(const TickMetrics& m, std::ostream& out) {
    out << m.day << ","
        << m.crime_events << ","
        << m.arrests << ","
        << m.wrongful_detentions << ","
        << m.detention_exits << ","
        << m.convictions << ","
        << m.releases() << ","
        << m.share(LegalStatus::Lawful) << ","
        << m.share(LegalStatus::AtRisk) << ","
        << m.share(LegalStatus::Criminal) << ","
        << m.share(LegalStatus::Detained) << ","
        << m.share(LegalStatus::Prison) << ","
        << m.edge_count << "\n";
}

void writeMetricsCsv(const std::vector<TickMetrics>& series, std::ostream& out) {
    out << metricsCsvHeader() << "\n";
    out << std::setprecision(6);
    for (const auto& m : series) {
        logMetrics(m, out);
    }
}

std::string fileSafeNumber(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    std::string s(buf);
    // strip trailing zeros, then a dangling point
    s.erase(s.find_last_not_of('0') + 1);
    if (!s.empty() && s.back() == '.') s.pop_back();
    for (auto& c : s) {
        if (c == '.') c = 'p';
    }
    return s;
}

std::string buildRunFileStem(const KernelConfig& cfg, const std::string& timestamp) {
    std::ostringstream os;
    if (!timestamp.empty()) os << timestamp << "__";
    os << "n" << cfg.population
       << "__m" << cfg.attachment
       << "__fc" << fileSafeNumber(cfg.forensicCapacity)
       << "__cc" << fileSafeNumber(cfg.coerciveCapacity)
       << "__det" << fileSafeNumber(cfg.detentionDaysMean)
       << "__evw" << cfg.evidenceWindowDays;
    return os.str();
}

void exportRun(const Kernel& kernel, const std::string& prefix) {
    const std::string csvPath = prefix + ".csv";
    std::ofstream csv(csvPath);
    if (!csv.is_open()) {
        throw std::runtime_error("could not open '" + csvPath + "' for writing");
    }
    writeMetricsCsv(kernel.metrics().records(), csv);

    const std::string cfgPath = prefix + ".yml";
    std::ofstream params(cfgPath);
    if (!params.is_open()) {
        throw std::runtime_error("could not open '" + cfgPath + "' for writing");
    }
    writeConfig(kernel.config(), params);

    if (!csv || !params) {
        throw std::runtime_error("write failed for run export '" + prefix + "'");
    }
}
