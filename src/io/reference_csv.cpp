#include "dvb/io/reference_csv.hpp"
#include "dvb/core/errors.hpp"
#include <fstream>
#include <unordered_map>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <limits>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// CSV splitter minimal qui gère les champs entre "..."
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// parse double strict ("" ou texte -> NaN)
static double parse_double(const std::string& s) {
  if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end==s.c_str()) return std::numeric_limits<double>::quiet_NaN();
  return v;
}

// récupère index de colonne via map (synonymes acceptés)
static int col(const std::unordered_map<std::string,int>& idx, std::initializer_list<const char*> names) {
  for (auto* n: names) {
    auto it = idx.find(lower(n));
    if (it != idx.end()) return it->second;
  }
  return -1;
}

struct Diag {
  std::size_t* num_ignored;
  std::vector<std::string>* warnings;
  void ignore(const std::string& why, std::size_t line_no) const {
    if (num_ignored) (*num_ignored)++;
    if (warnings) warnings->push_back("Ligne " + std::to_string(line_no) + " ignorée: " + why);
  }
  void warn(const std::string& msg) const {
    if (warnings) warnings->push_back(msg);
  }
};

// Parcourt un CSV à en-tête ; on_row(idx, cells, line_no) pour chaque ligne de données.
using RowFn = std::function<void(const std::unordered_map<std::string,int>&,
                                 const std::vector<std::string>&, std::size_t)>;

static void for_each_row(const std::string& path, const Diag& diag, const RowFn& on_row) {
  std::ifstream f(path);
  if (!f) {
    diag.warn("Impossible d'ouvrir le fichier: " + path);
    return;
  }

  std::string line;
  std::unordered_map<std::string,int> idx;
  bool header_seen = false;
  std::size_t line_no = 0;

  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);

    if (!header_seen) {
      header_seen = true;
      for (int i=0;i<(int)cells.size();++i) idx[lower(trim(cells[i]))] = i;
      continue;
    }
    on_row(idx, cells, line_no);
  }
  if (!header_seen) diag.warn("Fichier vide (pas d'en-tête): " + path);
}

// "YYYY-MM-DD" strict
static bool is_iso_date(const std::string& s) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
  for (int i : {0,1,2,3,5,6,8,9}) if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  return true;
}

static std::string cell(const std::vector<std::string>& cells, int i) {
  return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
}

} // namespace

namespace dvb::io {

market::RouteTable
read_routes_csv(const std::string& path,
                std::size_t* num_ignored,
                std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  const Diag diag{num_ignored, warnings};
  market::RouteTable out;

  for_each_row(path, diag, [&](const auto& idx, const auto& cells, std::size_t n) {
    const int iLoad = col(idx, {"load_port","origin","from"});
    const int iDis  = col(idx, {"discharge_port","destination","to"});
    const int iDist = col(idx, {"distance_nm","distance"});

    const std::string load = cell(cells, iLoad);
    const std::string dis  = cell(cells, iDis);
    const double dist      = parse_double(cell(cells, iDist));

    if (load.empty() || dis.empty()) { diag.ignore("port manquant", n); return; }
    if (!std::isfinite(dist))        { diag.ignore("distance invalide", n); return; }
    if (out.contains(load, dis))     { diag.ignore("route dupliquée " + load + " -> " + dis, n); return; }

    try {
      out.add(market::Route(load, dis, dist));
    } catch (const core::InvalidConfigError& e) {
      diag.ignore(e.what(), n);
    }
  });
  return out;
}

market::VesselTable
read_vessels_csv(const std::string& path,
                 std::size_t* num_ignored,
                 std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  const Diag diag{num_ignored, warnings};
  market::VesselTable out;

  for_each_row(path, diag, [&](const auto& idx, const auto& cells, std::size_t n) {
    const std::string cls = cell(cells, col(idx, {"vessel_class","class"}));
    const double cap     = parse_double(cell(cells, col(idx, {"cargo_capacity_m3","capacity_m3"})));
    const double laden   = parse_double(cell(cells, col(idx, {"laden_speed_kn"})));
    const double ballast = parse_double(cell(cells, col(idx, {"ballast_speed_kn"})));
    const double bog     = parse_double(cell(cells, col(idx, {"boil_off_pct_per_day","bog_pct_per_day"})));
    const double fuel_l  = parse_double(cell(cells, col(idx, {"fuel_consumption_tpd_laden"})));
    const double fuel_b  = parse_double(cell(cells, col(idx, {"fuel_consumption_tpd_ballast"})));

    if (cls.empty()) { diag.ignore("vessel_class manquant", n); return; }
    for (double v : {cap, laden, bog, fuel_l}) {
      if (!std::isfinite(v)) { diag.ignore("champ numérique invalide (" + cls + ")", n); return; }
    }
    if (out.contains(cls)) { diag.ignore("classe dupliquée " + cls, n); return; }

    try {
      // vitesse / conso sur lest optionnelles (jambe non modélisée)
      out.add(market::Vessel(cls, cap, laden,
                             std::isfinite(ballast) ? ballast : laden,
                             bog, fuel_l,
                             std::isfinite(fuel_b) ? fuel_b : fuel_l));
    } catch (const core::InvalidConfigError& e) {
      diag.ignore(e.what(), n);
    }
  });
  return out;
}

std::map<std::string, double>
read_params_csv(const std::string& path,
                std::size_t* num_ignored,
                std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  const Diag diag{num_ignored, warnings};
  std::map<std::string, double> out;

  for_each_row(path, diag, [&](const auto& idx, const auto& cells, std::size_t n) {
    const std::string key = cell(cells, col(idx, {"param","key","name"}));
    const double v        = parse_double(cell(cells, col(idx, {"value","val"})));
    if (key.empty())       { diag.ignore("param manquant", n); return; }
    if (!std::isfinite(v)) { diag.ignore("valeur invalide pour " + key, n); return; }
    out[key] = v;
  });
  return out;
}

std::vector<market::MarketObservation>
read_history_csv(const std::string& path,
                 std::size_t* num_ignored,
                 std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  const Diag diag{num_ignored, warnings};
  std::vector<market::MarketObservation> out;

  for_each_row(path, diag, [&](const auto& idx, const auto& cells, std::size_t n) {
    std::string date = cell(cells, col(idx, {"date","asof"}));
    if (date.size() > 10) date = date.substr(0, 10); // "YYYY-MM-DD hh:mm:ss" -> jour

    market::MarketObservation obs;
    obs.date = date;
    obs.inputs.price_a              = parse_double(cell(cells, col(idx, {"TTF_USD_MMBTU","price_a","ttf"})));
    obs.inputs.price_b              = parse_double(cell(cells, col(idx, {"JKM_USD_MMBTU","price_b","jkm"})));
    obs.inputs.freight_rate_usd_day = parse_double(cell(cells, col(idx, {"FREIGHT_USD_DAY","freight"})));
    obs.inputs.fuel_price_usd_t     = parse_double(cell(cells, col(idx, {"FUEL_USD_PER_T","fuel"})));
    obs.inputs.eua_price_usd_t      = parse_double(cell(cells, col(idx, {"EUA_USD_PER_TCO2","eua"})));

    if (!is_iso_date(date)) { diag.ignore("date invalide", n); return; }
    const auto& in = obs.inputs;
    for (double v : {in.price_a, in.price_b, in.freight_rate_usd_day, in.fuel_price_usd_t, in.eua_price_usd_t}) {
      if (!std::isfinite(v)) { diag.ignore("valeur manquante au " + date, n); return; }
    }
    out.push_back(std::move(obs));
  });
  return out;
}

market::ReferenceData
load_reference_data(const std::string& dir, std::vector<std::string>* warnings)
{
  const std::string base = dir.empty() || dir.back()=='/' ? dir : dir + "/";
  return market::ReferenceData{
    read_routes_csv(base + "routes.csv", nullptr, warnings),
    read_vessels_csv(base + "vessels.csv", nullptr, warnings),
    market::CarbonParams{read_params_csv(base + "carbon_params.csv", nullptr, warnings)}
  };
}

} // namespace dvb::io
