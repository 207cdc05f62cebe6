//
//  TemplateExpander.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "TemplateExpander.hpp"

#include <functional>
#include <optional>

#include <stdlib.h>
#include <strings.h>

/*
 Replaces every "<open>name}" token for which resolve() yields a value.
 name is non-empty and runs up to the next '}'.
 With skipDollar, tokens directly preceded by '$' are left for the ${} pass
 */
static std::string replace_tokens(const std::string &text, const std::string &open, bool skipDollar,
                                  std::function<std::optional<std::string>(const std::string &name)> resolve){
    std::string ret;
    size_t pos = 0;
    while (true) {
        size_t start = text.find(open, pos);
        size_t end = std::string::npos;
        if (start == std::string::npos) break;
        if ((end = text.find('}', start + open.size())) == std::string::npos) break;
        if (end == start + open.size() || (skipDollar && start > 0 && text[start-1] == '$')) {
            //not a token, retry from the next character
            ret += text.substr(pos, start + 1 - pos);
            pos = start + 1;
            continue;
        }
        ret += text.substr(pos, start - pos);
        {
            std::string name = text.substr(start + open.size(), end - start - open.size());
            std::optional<std::string> val = resolve(name);
            ret += val ? *val : text.substr(start, end + 1 - start);
        }
        pos = end + 1;
    }
    ret += text.substr(pos);
    return ret;
}

std::string TemplateExpander::expand(const std::string &text, const PluginContext &ctx){
    std::string ret;

    ret = replace_tokens(text, "{", true, [&ctx](const std::string &name) -> std::optional<std::string>{
        auto v = ctx.variables.find(name);
        if (v != ctx.variables.end()) return v->second;
        if (!strcasecmp(name.c_str(), "installFolder")) return ctx.installFolder;
        return std::nullopt;
    });

    ret = replace_tokens(ret, "${", false, [&ctx](const std::string &name) -> std::optional<std::string>{
        const char *env = NULL;
        if (!strcasecmp(name.c_str(), "INSTALL_FOLDER")) return ctx.installFolder;
        if ((env = getenv(name.c_str())) && *env) return std::string(env);
        auto v = ctx.variables.find(name);
        if (v != ctx.variables.end()) return v->second;
        return std::nullopt;
    });

    return ret;
}

std::vector<std::string> TemplateExpander::expandList(const std::vector<std::string> &items, const PluginContext &ctx){
    std::vector<std::string> ret;
    for (auto &i : items) ret.push_back(expand(i, ctx));
    return ret;
}

std::map<std::string,std::string> TemplateExpander::expandMap(const std::map<std::string,std::string> &map, const PluginContext &ctx){
    std::map<std::string,std::string> ret;
    for (auto &kv : map) ret[expand(kv.first, ctx)] = expand(kv.second, ctx);
    return ret;
}
