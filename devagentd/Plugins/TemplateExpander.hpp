//
//  TemplateExpander.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef TemplateExpander_hpp
#define TemplateExpander_hpp

#include "PluginContext.hpp"

#include <map>
#include <string>
#include <vector>

/*
 Two pass placeholder substitution:
   {name}   context variables (case-insensitive), {installFolder} falls back to the context's install folder
   ${NAME}  INSTALL_FOLDER, then the process environment, then context variables
 Unresolved tokens are left as they are.
 */
class TemplateExpander{
public:
    static std::string expand(const std::string &text, const PluginContext &ctx);
    static std::vector<std::string> expandList(const std::vector<std::string> &items, const PluginContext &ctx);
    static std::map<std::string,std::string> expandMap(const std::map<std::string,std::string> &map, const PluginContext &ctx);
};

#endif /* TemplateExpander_hpp */
