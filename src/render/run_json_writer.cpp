#include "line_chunker/run_json.hpp"
#include <sstream>
#include <cmath> // std::isfinite

namespace lc {

static void esc(std::ostringstream& o, const std::string& s){
  static const char* hex = "0123456789abcdef";
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
          o << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  const RunStats& s = p.stats;
  std::ostringstream o;
  o << "{";
  o << "\"input\":";         esc(o, p.input_path);    o << ",";
  o << "\"file_size\":" << p.file_size << ",";
  o << "\"output_prefix\":"; esc(o, p.output_prefix); o << ",";
  o << "\"encoding\":";      esc(o, p.encoding);      o << ",";
  o << "\"line_ending\":";   esc(o, p.line_ending);   o << ",";
  o << "\"chunk_bytes\":" << p.chunk_bytes << ",";
  o << "\"level\":" << p.level << ",";

  o << "\"chunks\":" << s.chunks << ",";
  o << "\"bytes\":" << s.bytes_in << ",";
  o << "\"compressed_bytes\":" << s.bytes_out << ",";
  o << "\"compression_ratio\":" << safe_num(s.compression_ratio) << ",";
  o << "\"decode_warnings\":" << s.decode_warnings << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"peak_buffer_bytes\":" << p.peak_buffer_bytes << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << safe_num(s.stages[i].duration_ms) << "}";
  }
  o << "],";

  o << "\"files\":[";
  for (size_t i=0;i<p.chunks.size();++i){
    if (i) o << ",";
    const auto& c = p.chunks[i];
    o << "{\"index\":" << c.index << ",\"path\":"; esc(o, c.path);
    o << ",\"raw_bytes\":" << c.raw_bytes
      << ",\"compressed_bytes\":" << c.compressed_bytes
      << ",\"sha256\":"; esc(o, c.sha256);
    o << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

}
