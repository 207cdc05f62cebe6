//
//  plistjson.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef plistjson_hpp
#define plistjson_hpp

#include <plist/plist.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

plist_t plistjson_read_file(const char *filePath);
void plistjson_write_file(plist_t plist, const char *dst);
std::string plistjson_to_string(plist_t plist, bool prettify = true);
plist_t plistjson_from_string(const std::string &json);

#pragma mark dict accessors
std::optional<std::string> plistjson_dict_string(plist_t dict, const char *key);
std::optional<int64_t> plistjson_dict_int(plist_t dict, const char *key);
std::optional<bool> plistjson_dict_bool(plist_t dict, const char *key);
std::vector<std::string> plistjson_dict_string_array(plist_t dict, const char *key);
std::map<std::string,std::string> plistjson_dict_string_map(plist_t dict, const char *key);

void plistjson_dict_set_string(plist_t dict, const char *key, const std::string &val);
void plistjson_dict_set_int(plist_t dict, const char *key, int64_t val);
void plistjson_dict_set_bool(plist_t dict, const char *key, bool val);
void plistjson_dict_set_string_array(plist_t dict, const char *key, const std::vector<std::string> &val);
void plistjson_dict_set_string_map(plist_t dict, const char *key, const std::map<std::string,std::string> &val);

#endif /* plistjson_hpp */
