#include "lint/Formatter.hpp"

#include "doc/TextUtil.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace lint {

SummaryStats summary_stats(const std::vector<ValidationResult>& results) {
    SummaryStats st;
    st.total_files = results.size();

    auto tally = [&](const ValidationError& e) {
        st.findings_by_kind[error_kind_str(e.kind)] += 1;
        if (e.rule) st.findings_by_rule[*e.rule] += 1;
    };

    for (const auto& r : results) {
        if (r.valid) st.valid_files += 1;
        st.total_errors += r.errors.size();
        st.total_warnings += r.warnings.size();
        for (const auto& e : r.errors) tally(e);
        for (const auto& w : r.warnings) tally(w);
    }
    return st;
}

static std::string format_finding(const ValidationError& e, bool show_suggestions) {
    std::ostringstream out;
    out << "  " << severity_str(e.severity) << ": " << e.message;

    if (e.location) {
        std::vector<std::string> parts;
        if (e.location->line) parts.push_back("line " + std::to_string(*e.location->line));
        if (e.location->column) parts.push_back("col " + std::to_string(*e.location->column));
        if (e.location->section) parts.push_back("section \"" + *e.location->section + "\"");
        if (!parts.empty()) out << " (" << textutil::join(parts, ", ") << ")";
    }

    if (e.rule) out << " [" << *e.rule << "]";
    out << "\n";

    if (show_suggestions && e.suggestion) out << "    suggestion: " << *e.suggestion << "\n";
    return out.str();
}

std::string format_text(const std::vector<ValidationResult>& results, bool verbose, bool show_suggestions) {
    std::ostringstream out;

    for (const auto& r : results) {
        out << (r.valid ? "OK   " : "FAIL ") << r.source_path;
        if (r.document_type && r.document_id) out << " (" << *r.document_type << ":" << *r.document_id << ")";
        out << "\n";

        for (const auto& e : r.errors) out << format_finding(e, show_suggestions);
        if (verbose || r.errors.empty()) {
            for (const auto& w : r.warnings) out << format_finding(w, show_suggestions);
        }
    }

    return out.str();
}

std::string format_summary(const std::vector<ValidationResult>& results) {
    const SummaryStats st = summary_stats(results);
    const double rate = st.total_files > 0 ? 100.0 * (double)st.valid_files / (double)st.total_files : 0.0;

    std::ostringstream out;
    out << "\nSummary:\n";
    out << "Files processed: " << st.total_files << "\n";
    out << "Valid files: " << st.valid_files << "\n";
    out << "Invalid files: " << (st.total_files - st.valid_files) << "\n";
    out << "Total errors: " << st.total_errors << "\n";
    out << "Total warnings: " << st.total_warnings << "\n";
    out << "Success rate: " << std::fixed << std::setprecision(1) << rate << "%\n";
    return out.str();
}

static json finding_to_json(const ValidationError& e) {
    json j;
    j["kind"] = error_kind_str(e.kind);
    j["severity"] = severity_str(e.severity);
    j["message"] = e.message;

    if (e.location) {
        json loc = json::object();
        if (e.location->line) loc["line"] = *e.location->line;
        if (e.location->column) loc["column"] = *e.location->column;
        if (e.location->section) loc["section"] = *e.location->section;
        j["location"] = loc;
    }
    if (e.rule) j["rule"] = *e.rule;
    if (e.suggestion) j["suggestion"] = *e.suggestion;
    return j;
}

json results_to_json(const std::vector<ValidationResult>& results) {
    json arr = json::array();

    for (const auto& r : results) {
        json j;
        j["source_path"] = r.source_path;
        if (r.document_type) j["document_type"] = *r.document_type;
        if (r.document_id) j["document_id"] = *r.document_id;
        j["valid"] = r.valid;

        j["errors"] = json::array();
        for (const auto& e : r.errors) j["errors"].push_back(finding_to_json(e));

        j["warnings"] = json::array();
        for (const auto& w : r.warnings) j["warnings"].push_back(finding_to_json(w));

        arr.push_back(j);
    }
    return arr;
}

std::string format_json(const std::vector<ValidationResult>& results) {
    return results_to_json(results).dump(2) + "\n";
}

static std::string xml_attr_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

// "]]>" cannot appear inside a CDATA section
static std::string cdata_escape(const std::string& s) {
    std::string out;
    size_t start = 0;
    for (size_t pos = s.find("]]>"); pos != std::string::npos; pos = s.find("]]>", start)) {
        out += s.substr(start, pos - start) + "]]]]><![CDATA[>";
        start = pos + 3;
    }
    out += s.substr(start);
    return out;
}

static std::string junit_case_name(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (unsigned char c : path) {
        out.push_back((std::isalnum(c) || c == '.' || c == '-') ? (char)c : '_');
    }
    return out;
}

std::string format_junit(const std::vector<ValidationResult>& results) {
    size_t failures = 0;
    for (const auto& r : results) {
        if (!r.valid) failures += 1;
    }

    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    xml << "<testsuite name=\"planlint\" tests=\"" << results.size() << "\" failures=\"" << failures
        << "\" time=\"0\">\n";

    for (const auto& r : results) {
        xml << "  <testcase name=\"" << xml_attr_escape(junit_case_name(r.source_path))
            << "\" classname=\"planlint\"";

        if (r.valid) {
            xml << " />\n";
            continue;
        }

        xml << ">\n";
        for (const auto& e : r.errors) {
            std::string text = e.message;
            if (e.location && e.location->line) text += " (line " + std::to_string(*e.location->line) + ")";
            if (e.rule) text += " [" + *e.rule + "]";

            xml << "    <failure type=\"" << error_kind_str(e.kind) << "\"><![CDATA[" << cdata_escape(text)
                << "]]></failure>\n";
        }
        xml << "  </testcase>\n";
    }

    xml << "</testsuite>\n";
    return xml.str();
}

std::string format_document_types(const std::vector<schema::DocumentTypeDefinition>& types) {
    static const std::vector<std::string> known = {"discovery", "design", "development", "testing", "release"};

    // known categories first, then the rest alphabetically
    std::vector<std::string> order = known;
    std::set<std::string> extra;
    for (const auto& t : types) {
        if (std::find(known.begin(), known.end(), t.category) == known.end()) extra.insert(t.category);
    }
    order.insert(order.end(), extra.begin(), extra.end());

    std::ostringstream out;
    out << "Available document types:\n\n";

    for (const auto& category : order) {
        bool header = false;
        for (const auto& t : types) {
            if (t.category != category) continue;

            if (!header) {
                std::string upper = category;
                for (char& c : upper) c = (char)std::toupper((unsigned char)c);
                out << upper << ":\n";
                header = true;
            }
            out << "  " << std::left << std::setw(20) << t.type_name << " " << t.display_name << "\n";
            if (!t.description.empty()) out << "    " << t.description << "\n";
            out << "\n";
        }
    }

    return out.str();
}

}  // namespace lint
