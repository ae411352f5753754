#include "esync/io/open_ephys.hpp"
#include "esync/errors.hpp"
#include "esync/io/npy.hpp"
#include "esync/log.hpp"
#include <algorithm>
#include <fstream>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace esync::io {

namespace {

std::string slurp(const fs::path& p) {
    std::ifstream ifs(p);
    if (!ifs) throw MissingFileError(p);
    return std::string((std::istreambuf_iterator<char>(ifs)), {});
}

// Top-level objects of a JSON array body, with nested arrays/objects removed
// so that key lookups only see the object's own scalar members.
std::vector<std::string> flat_objects(const std::string& txt, size_t open_bracket) {
    std::vector<std::string> objs;
    std::string cur;
    int depth = 0;  // 1 = inside the array, 2 = inside an element object
    bool in_str = false, esc = false;
    for (size_t i = open_bracket; i < txt.size(); ++i) {
        char c = txt[i];
        if (in_str) {
            if (depth == 2) cur.push_back(c);
            if (esc) esc = false;
            else if (c == '\\') esc = true;
            else if (c == '"') in_str = false;
            continue;
        }
        if (c == '"') {
            in_str = true;
            if (depth == 2) cur.push_back(c);
            continue;
        }
        if (c == '[' || c == '{') {
            ++depth;
            if (depth == 2) cur.clear();
            continue;
        }
        if (c == ']' || c == '}') {
            if (depth == 2) objs.push_back(cur);
            if (--depth == 0) break;
            continue;
        }
        if (depth == 2) cur.push_back(c);
    }
    return objs;
}

bool find_string(const std::string& obj, const std::string& key, std::string& out) {
    std::smatch m;
    std::regex re("\"" + key + "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
    if (!std::regex_search(obj, m, re)) return false;
    out = m[1];
    return true;
}

bool find_number(const std::string& obj, const std::string& key, double& out) {
    std::smatch m;
    std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9.eE+-]+)");
    if (!std::regex_search(obj, m, re)) return false;
    out = std::stod(m[1]);
    return true;
}

int trailing_index(const std::string& name, const std::string& prefix) {
    if (name.rfind(prefix, 0) != 0) return -1;
    try {
        return std::stoi(name.substr(prefix.size()));
    } catch (const std::exception&) {
        return -1;
    }
}

std::vector<fs::path> sorted_subdirs(const fs::path& dir) {
    std::vector<fs::path> out;
    for (const auto& e : fs::directory_iterator(dir))
        if (e.is_directory()) out.push_back(e.path());
    std::sort(out.begin(), out.end());
    return out;
}

const std::string RECORD_NODE = "Record Node ";

} // namespace

std::vector<OebinStream> parse_oebin_continuous(const std::string& json_text) {
    auto pos = json_text.find("\"continuous\"");
    if (pos == std::string::npos) throw std::runtime_error("structure.oebin has no continuous section");
    pos = json_text.find('[', pos);
    if (pos == std::string::npos) throw std::runtime_error("structure.oebin continuous section is not an array");
    std::vector<OebinStream> out;
    for (const auto& obj : flat_objects(json_text, pos)) {
        OebinStream s;
        double v = 0.0;
        if (!find_string(obj, "folder_name", s.folder_name))
            throw std::runtime_error("continuous entry without folder_name");
        while (!s.folder_name.empty() && s.folder_name.back() == '/') s.folder_name.pop_back();
        if (!find_string(obj, "stream_name", s.stream_name)) s.stream_name = s.folder_name;
        if (find_number(obj, "sample_rate", v)) s.sample_rate = v;
        if (find_number(obj, "source_processor_id", v)) s.source_processor_id = static_cast<int>(v);
        out.push_back(std::move(s));
    }
    return out;
}

std::vector<fs::path> find_recordings(const fs::path& root) {
    if (!fs::is_directory(root)) throw MissingFileError("Data directory does not exist: " + root.string(), root);
    std::vector<fs::path> nodes;
    if (root.filename().string().rfind(RECORD_NODE, 0) == 0) {
        nodes.push_back(root);
    } else {
        for (const auto& d : sorted_subdirs(root))
            if (d.filename().string().rfind(RECORD_NODE, 0) == 0) nodes.push_back(d);
    }
    std::vector<fs::path> out;
    for (const auto& node : nodes)
        for (const auto& exp : sorted_subdirs(node)) {
            if (trailing_index(exp.filename().string(), "experiment") < 0) continue;
            for (const auto& rec : sorted_subdirs(exp))
                if (trailing_index(rec.filename().string(), "recording") >= 0 &&
                    fs::exists(rec / "structure.oebin"))
                    out.push_back(rec);
        }
    return out;
}

RecordingId recording_id(const fs::path& recording_dir) {
    RecordingId id;
    id.recording_index = trailing_index(recording_dir.filename().string(), "recording");
    id.experiment_index = trailing_index(recording_dir.parent_path().filename().string(), "experiment");
    std::string node = recording_dir.parent_path().parent_path().filename().string();
    id.record_node = node.rfind(RECORD_NODE, 0) == 0 ? node.substr(RECORD_NODE.size()) : node;
    return id;
}

Recording load_recording(const fs::path& recording_dir, const std::string& timestamp_filename) {
    Recording rec;
    rec.directory = recording_dir;
    rec.id = recording_id(recording_dir);

    const auto streams = parse_oebin_continuous(slurp(recording_dir / "structure.oebin"));
    for (size_t i = 0; i < streams.size(); ++i) {
        const auto& s = streams[i];
        ContinuousStream cs;
        cs.name = s.stream_name;
        cs.folder_name = s.folder_name;
        cs.sample_rate = s.sample_rate;
        cs.source_processor_id = s.source_processor_id;
        const fs::path cdir = recording_dir / "continuous" / s.folder_name;
        try {
            cs.sample_numbers = read_npy_i64(cdir / "sample_numbers.npy");
            cs.timestamps = read_npy_f64(cdir / timestamp_filename);
            if (cs.timestamps.size() != cs.sample_numbers.size())
                throw DataIntegrityError("sample_numbers/timestamps length mismatch in " + cdir.string());
        } catch (const std::runtime_error& e) {
            ESYNC_ERRORF("%s", e.what());
            cs.load_error = e.what();
        }
        rec.continuous.push_back(std::move(cs));

        const fs::path tdir = recording_dir / "events" / s.folder_name / "TTL";
        if (!fs::is_directory(tdir)) {
            ESYNC_DEBUGF("no TTL events for %s", s.folder_name.c_str());
            continue;
        }
        try {
            auto states = read_npy_i64(tdir / "states.npy");
            auto samples = read_npy_i64(tdir / "sample_numbers.npy");
            auto times = read_npy_f64(tdir / timestamp_filename);
            if (states.size() != samples.size() || states.size() != times.size())
                throw DataIntegrityError("TTL arrays have different lengths in " + tdir.string());
            for (size_t k = 0; k < states.size(); ++k) {
                if (states[k] == 0) continue;
                Event e;
                e.stream = i;
                e.line = static_cast<int>(states[k] > 0 ? states[k] : -states[k]);
                e.state = states[k] > 0 ? 1 : 0;
                e.sample_number = samples[k];
                e.timestamp = times[k];
                rec.events.push_back(e);
            }
        } catch (const std::runtime_error& e) {
            ESYNC_ERRORF("%s", e.what());
            if (rec.continuous.back().load_error.empty()) rec.continuous.back().load_error = e.what();
        }
    }
    return rec;
}

std::vector<Recording> load_session(const fs::path& root, const std::string& timestamp_filename) {
    std::vector<Recording> out;
    for (const auto& dir : find_recordings(root)) out.push_back(load_recording(dir, timestamp_filename));
    ESYNC_INFOF("Loaded %zu recording(s) from %s", out.size(), root.string().c_str());
    return out;
}

fs::path continuous_dir(const Recording& rec, size_t stream) {
    return rec.directory / "continuous" / rec.continuous.at(stream).folder_name;
}

fs::path events_dir(const Recording& rec, size_t stream) {
    return rec.directory / "events" / rec.continuous.at(stream).folder_name / "TTL";
}

} // namespace esync::io
