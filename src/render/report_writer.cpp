#include "shread/report.hpp"
#include "shread/decoder.hpp"
#include "shread/read_config.hpp"

#include <cstdio>
#include <sstream>

namespace shread {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(c));
          o << tmp;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

std::string ReportWriter::to_json(const ReadOutcome& r, const VarStore& vars,
                                  const std::vector<std::string>& names) {
  std::ostringstream o;
  o << "{";
  o << "\"status\":"; esc(o, to_string(r.status)); o << ",";
  o << "\"exit_code\":" << exit_code(r.status) << ",";
  o << "\"strategy\":"; esc(o, to_string(r.strategy)); o << ",";
  o << "\"bytes\":" << r.bytes << ",";
  o << "\"records\":" << r.records << ",";

  o << "\"vars\":{";
  for (size_t i=0;i<names.size();++i){
    if (i) o << ",";
    esc(o, names[i]); o << ":[";
    if (const auto* v = vars.find(names[i])) {
      for (size_t j=0;j<v->values.size();++j){
        if (j) o << ",";
        esc(o, text2str(v->values[j]));
      }
    }
    o << "]";
  }
  o << "}";

  o << "}";
  return o.str();
}

std::string ReportWriter::to_shell(const VarStore& vars, const std::vector<std::string>& names,
                                   bool as_array) {
  std::ostringstream o;
  for (const auto& name : names) {
    const auto* v = vars.find(name);
    o << name << "=";
    if (as_array) {
      o << "(";
      if (v) {
        for (size_t j=0;j<v->values.size();++j){
          if (j) o << " ";
          o << text2str(escape_single_quoted(v->values[j]));
        }
      }
      o << ")";
    } else {
      std::u32string joined;
      if (v) {
        for (size_t j=0;j<v->values.size();++j){
          if (j) joined.push_back(U' ');
          joined += v->values[j];
        }
      }
      o << text2str(escape_single_quoted(joined));
    }
    o << "\n";
  }
  return o.str();
}

}
