#include "scaletuner/tuner_settings.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace scaletuner {

// Minimal JSON reader. Expects a well-formed file as written by save_settings().
static const char* find_value(const char* s, const char* key) {
    const char* p = std::strstr(s, key);
    if (!p) return nullptr;
    p = std::strchr(p, ':');
    if (!p) return nullptr;
    return p + 1;
}

static bool parse_key_value(const char* s, const char* key, float& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    out = std::strtof(p, nullptr);
    return true;
}
static bool parse_key_value(const char* s, const char* key, double& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    out = std::strtod(p, nullptr);
    return true;
}
static bool parse_key_value(const char* s, const char* key, int& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    out = static_cast<int>(std::strtol(p, nullptr, 10));
    return true;
}
static bool parse_key_value(const char* s, const char* key, unsigned int& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    out = static_cast<unsigned int>(std::strtoul(p, nullptr, 10));
    return true;
}
static bool parse_key_value(const char* s, const char* key, std::size_t& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    out = static_cast<std::size_t>(std::strtoull(p, nullptr, 10));
    return true;
}
static bool parse_key_value(const char* s, const char* key, bool& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    while (*p == ' ' || *p == '\t') ++p;
    if (std::strncmp(p, "true", 4) == 0) { out = true; return true; }
    if (std::strncmp(p, "false", 5) == 0) { out = false; return true; }
    return false;
}
static bool parse_key_value(const char* s, const char* key, std::string& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != '"') return false;
    ++p;
    const char* start = p;
    while (*p && *p != '"' && *p != '\n' && *p != '\r') ++p;
    out.assign(start, p - start);
    return true;
}

bool load_settings(const char* path, TunerSettings& st) {
    FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1 << 20) { std::fclose(f); return false; }
    std::string buf;
    buf.resize(static_cast<size_t>(sz));
    size_t n = std::fread(&buf[0], 1, static_cast<size_t>(sz), f);
    std::fclose(f);
    if (n != static_cast<size_t>(sz)) return false;

    const char* s = buf.c_str();
    parse_key_value(s, "\"device_name\"", st.audio.device_name);
    parse_key_value(s, "\"channels\"", st.audio.channels);
    parse_key_value(s, "\"sample_rate\"", st.audio.sample_rate);
    parse_key_value(s, "\"period_size\"", st.audio.period_size);
    parse_key_value(s, "\"num_periods\"", st.audio.num_periods);
    parse_key_value(s, "\"use_realtime_priority\"", st.audio.use_realtime_priority);
    parse_key_value(s, "\"buffer_seconds\"", st.buffer_seconds);
    parse_key_value(s, "\"tick_interval_ms\"", st.tick_interval_ms);

    parse_key_value(s, "\"fmin\"", st.pitch.fmin);
    parse_key_value(s, "\"fmax\"", st.pitch.fmax);
    parse_key_value(s, "\"min_thresh\"", st.pitch.min_thresh);
    parse_key_value(s, "\"abs_thresh\"", st.pitch.abs_thresh);
    parse_key_value(s, "\"onset_thresh\"", st.pitch.onset_thresh);
    parse_key_value(s, "\"offset_thresh_2\"", st.pitch.offset_thresh_2);
    parse_key_value(s, "\"integer_thresh\"", st.pitch.integer_thresh);
    parse_key_value(s, "\"interp_half_width\"", st.pitch.interp_half_width);
    parse_key_value(s, "\"interp_upsample_fac\"", st.pitch.interp_upsample_fac);

    parse_key_value(s, "\"tuning_note\"", st.intonation.tuning_note);
    parse_key_value(s, "\"tuning_pitch\"", st.intonation.tuning_pitch);
    parse_key_value(s, "\"history_length\"", st.intonation.history_length);

    if (parse_key_value(s, "\"verbose\"", st.audio.verbose)) {
        st.pitch.verbose = st.audio.verbose;
    }
    return true;
}

bool save_settings(const char* path, const TunerSettings& st) {
    FILE* f = std::fopen(path, "wb");
    if (!f) return false;
    std::fprintf(f,
        "{\n"
        "  \"device_name\": \"%s\",\n"
        "  \"channels\": %u,\n"
        "  \"sample_rate\": %u,\n"
        "  \"period_size\": %u,\n"
        "  \"num_periods\": %u,\n"
        "  \"use_realtime_priority\": %s,\n"
        "  \"buffer_seconds\": %.4f,\n"
        "  \"tick_interval_ms\": %d,\n"
        "  \"fmin\": %.3f,\n"
        "  \"fmax\": %.3f,\n"
        "  \"min_thresh\": %.4f,\n"
        "  \"abs_thresh\": %.4f,\n"
        "  \"onset_thresh\": %.4f,\n"
        "  \"offset_thresh_2\": %.4f,\n"
        "  \"integer_thresh\": %.4f,\n"
        "  \"interp_half_width\": %d,\n"
        "  \"interp_upsample_fac\": %d,\n"
        "  \"tuning_note\": %d,\n"
        "  \"tuning_pitch\": %.3f,\n"
        "  \"history_length\": %zu,\n"
        "  \"verbose\": %s\n"
        "}\n",
        st.audio.device_name.c_str(),
        st.audio.channels,
        st.audio.sample_rate,
        st.audio.period_size,
        st.audio.num_periods,
        st.audio.use_realtime_priority ? "true" : "false",
        st.buffer_seconds,
        st.tick_interval_ms,
        st.pitch.fmin,
        st.pitch.fmax,
        st.pitch.min_thresh,
        st.pitch.abs_thresh,
        st.pitch.onset_thresh,
        st.pitch.offset_thresh_2,
        st.pitch.integer_thresh,
        st.pitch.interp_half_width,
        st.pitch.interp_upsample_fac,
        st.intonation.tuning_note,
        st.intonation.tuning_pitch,
        st.intonation.history_length,
        st.audio.verbose ? "true" : "false");
    const bool ok = std::ferror(f) == 0;
    std::fclose(f);
    return ok;
}

} // namespace scaletuner
