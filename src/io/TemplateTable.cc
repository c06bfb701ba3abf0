#include "poissonplr/io/TemplateTable.hh"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace poissonplr::io {

namespace {
inline bool is_comment_or_empty(const std::string& s) {
  for (char c : s) { if (c == '#') return true; if (!std::isspace(static_cast<unsigned char>(c))) return false; }
  return true;
}

inline void trim(std::string& s) {
  size_t i = 0; while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  size_t j = s.size(); while (j > i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
  s = s.substr(i, j - i);
}

std::vector<std::string> split_fields(const std::string& line) {
  std::vector<std::string> out;
  if (line.find(',') != std::string::npos) {
    std::stringstream ss(line);
    std::string f;
    while (std::getline(ss, f, ',')) { trim(f); out.push_back(f); }
  } else {
    std::stringstream ss(line);
    std::string f;
    while (ss >> f) out.push_back(f);
  }
  return out;
}

inline bool to_double(const std::string& s, double& v) {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  v = std::strtod(s.c_str(), &end);
  return errno == 0 && end == s.c_str() + s.size();
}
} // namespace

bool TemplateTable::fail_(const std::string& msg) {
  signal_.clear(); bkg_names_.clear(); bkg_.clear(); observed_.clear();
  error_ = msg;
  return false;
}

bool TemplateTable::LoadCSV(const std::string& path) {
  std::ifstream in(path);
  if (!in) return fail_("cannot open " + path);
  std::stringstream buf;
  buf << in.rdbuf();
  return Parse(buf.str());
}

bool TemplateTable::Parse(const std::string& text) {
  signal_.clear(); bkg_names_.clear(); bkg_.clear(); observed_.clear(); error_.clear();

  int col_signal = -1, col_observed = -1;
  std::vector<int> col_bkg;
  std::size_t ncols = 0;

  std::istringstream in(text);
  std::string line;
  bool saw_header = false;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (line.empty() || is_comment_or_empty(line)) continue;
    const auto fields = split_fields(line);

    if (!saw_header) {
      saw_header = true;
      ncols = fields.size();
      for (std::size_t c = 0; c < fields.size(); ++c) {
        const std::string& h = fields[c];
        if (h == "signal") col_signal = static_cast<int>(c);
        else if (h == "observed") col_observed = static_cast<int>(c);
        else if (h.rfind("bkg_", 0) == 0 && h.size() > 4) {
          const std::string name = h.substr(4);
          if (std::find(bkg_names_.begin(), bkg_names_.end(), name) != bkg_names_.end())
            return fail_("duplicate background column '" + h + "'");
          bkg_names_.push_back(name);
          col_bkg.push_back(static_cast<int>(c));
        }
        else return fail_("unknown column '" + h + "'");
      }
      if (col_signal < 0) return fail_("missing 'signal' column");
      if (col_bkg.empty()) return fail_("need at least one 'bkg_<name>' column");
      bkg_.assign(bkg_names_.size(), {});
      continue;
    }

    if (fields.size() != ncols)
      return fail_("line " + std::to_string(lineno) + ": expected " + std::to_string(ncols) +
                   " fields, got " + std::to_string(fields.size()));

    std::vector<double> row(ncols);
    for (std::size_t c = 0; c < ncols; ++c) {
      if (!to_double(fields[c], row[c]))
        return fail_("line " + std::to_string(lineno) + ": bad number '" + fields[c] + "'");
    }
    signal_.push_back(row[col_signal]);
    for (std::size_t k = 0; k < col_bkg.size(); ++k) bkg_[k].push_back(row[col_bkg[k]]);
    if (col_observed >= 0) observed_.push_back(row[col_observed]);
  }

  if (!saw_header) return fail_("empty table");
  if (signal_.empty()) return fail_("no data rows");
  return true;
}

std::unique_ptr<dataset::TemplateDataset>
TemplateTable::MakeDataset(const dataset::TemplateDatasetConfig& cfg,
                           const std::vector<std::string>& frozen) const {
  if (signal_.empty())
    throw std::runtime_error("TemplateTable: no table loaded");

  for (const auto& f : frozen) {
    if (std::find(bkg_names_.begin(), bkg_names_.end(), f) == bkg_names_.end())
      throw std::invalid_argument("TemplateTable: unknown frozen background '" + f + "'");
  }

  std::vector<dataset::BackgroundTemplate> bkgs;
  for (std::size_t k = 0; k < bkg_names_.size(); ++k) {
    dataset::BackgroundTemplate b;
    b.name = bkg_names_[k];
    b.counts = bkg_[k];
    b.frozen = std::find(frozen.begin(), frozen.end(), b.name) != frozen.end();
    bkgs.push_back(std::move(b));
  }

  if (has_observed())
    return std::make_unique<dataset::TemplateDataset>(signal_, std::move(bkgs), observed_, cfg);
  return std::make_unique<dataset::TemplateDataset>(signal_, std::move(bkgs), cfg);
}

} // namespace poissonplr::io
