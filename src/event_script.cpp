#include "event_script.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>
#include <utility>

namespace {
inline std::string_view ltrim(std::string_view s){ size_t i=0; while(i<s.size() && std::isspace((unsigned char)s[i])) ++i; return s.substr(i); }
inline std::string_view rtrim(std::string_view s){ size_t i=s.size(); while(i>0 && std::isspace((unsigned char)s[i-1])) --i; return s.substr(0,i); }
inline std::string_view trim (std::string_view s){ return rtrim(ltrim(s)); }

inline bool parseNumber(std::string_view s, double& v){
    s = trim(s); if(s.empty()) return false;
    std::string tmp{s}; char* end=nullptr;
    double d = std::strtod(tmp.c_str(), &end);
    if(end==tmp.c_str() || *end!='\0' || !std::isfinite(d)) return false;
    v = d; return true;
}
inline bool parseInt(std::string_view s, int& v){
    s = trim(s); if(s.empty()) return false;
    int sign=1; size_t i=0; if(s[0]=='-'){sign=-1;i=1;} else if(s[0]=='+'){i=1;} if(i==s.size()) return false;
    long long acc=0; for(; i<s.size(); ++i){ unsigned char c=s[i]; if(c<'0'||c>'9') return false; acc=acc*10+(c-'0'); if(acc>0x7fffffff) return false; }
    v = (int)acc*sign; return true;
}
inline bool isName(std::string_view s){
    if(s.empty() || !std::isalpha((unsigned char)s[0])) return false;
    for(char c: s) if(!std::isalnum((unsigned char)c) && c!='_') return false;
    return true;
}
}

bool ScriptEvent::number(const std::string& key, double& out) const {
    auto it = args.find(key);
    return it!=args.end() && parseNumber(it->second, out);
}

bool ScriptEvent::integer(const std::string& key, int& out) const {
    auto it = args.find(key);
    return it!=args.end() && parseInt(it->second, out);
}

bool ScriptEvent::flag(const std::string& key, bool fallback) const {
    auto it = args.find(key);
    if(it==args.end()) return fallback;
    const std::string& v = it->second;
    if(v=="1" || v=="true" || v=="yes") return true;
    if(v=="0" || v=="false" || v=="no") return false;
    return fallback;
}

bool EventScript::load(const std::string& path){
    std::ifstream is(path);
    if(!is){ events.clear(); error = "cannot open " + path; return false; }
    return parse(is);
}

bool EventScript::parse(std::istream& is){
    events.clear(); error.clear();
    std::string line; int lineNo = 0; double lastT = 0.0;
    auto fail = [&](const std::string& why){
        error = "line " + std::to_string(lineNo) + ": " + why;
        events.clear();
        return false;
    };
    while(std::getline(is,line)){
        ++lineNo;
        std::string_view sv = trim(line);
        if(auto h = sv.find('#'); h!=std::string_view::npos) sv = trim(sv.substr(0,h));
        if(sv.empty()) continue;

        std::istringstream ss{std::string(sv)};
        std::string tok;
        ScriptEvent ev; ev.line = lineNo;
        ss >> tok;
        if(!parseNumber(tok, ev.timeMs) || ev.timeMs < 0.0) return fail("bad timestamp '" + tok + "'");
        if(ev.timeMs < lastT) return fail("timestamp goes backwards");
        lastT = ev.timeMs;

        if(!(ss >> ev.name) || !isName(ev.name)) return fail("missing event name");
        while(ss >> tok){
            auto eq = tok.find('=');
            if(eq==std::string::npos || eq==0) return fail("expected key=value, got '" + tok + "'");
            std::string key = tok.substr(0,eq);
            if(!isName(key)) return fail("bad key '" + key + "'");
            ev.args[key] = tok.substr(eq+1);
        }
        events.push_back(std::move(ev));
    }
    return true;
}
