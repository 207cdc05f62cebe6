//
//  plistjson.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "plistjson.hpp"

#include <libgeneral/macros.h>

#include <sys/stat.h>
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

plist_t plistjson_read_file(const char *filePath){
    int fd = -1;
    char *fbuf = NULL;
    cleanup([&]{
        safeFree(fbuf);
        safeClose(fd);
    });
    struct stat finfo = {};

    retassure((fd = open(filePath, O_RDONLY))>0, "Failed to read json at path '%s': %s",filePath,strerror(errno));
    assure(!fstat(fd, &finfo));

    assure(fbuf = (char*)malloc(finfo.st_size+1));
    assure(read(fd, fbuf, finfo.st_size) == finfo.st_size);
    fbuf[finfo.st_size] = '\0';

    {
        plist_t pl = NULL;
        plist_from_json(fbuf, (uint32_t)finfo.st_size, &pl);
        retassure(pl, "failed to parse json at path '%s'",filePath);
        return pl;
    }
}

void plistjson_write_file(plist_t plist, const char *dst){
    char *buf = NULL;
    FILE *saveFile = NULL;
    cleanup([&]{
        safeFree(buf);
        safeFreeCustom(saveFile, fclose);
    });
    uint32_t bufLen = 0;
    std::string tmpPath = dst;
    tmpPath += ".tmp";

    retassure(!plist_to_json(plist, &buf, &bufLen, 1) && buf, "Failed to serialize json for '%s'",dst);

    //write next to the target, then swap it in
    retassure(saveFile = fopen(tmpPath.c_str(), "w"), "Failed to open '%s' for writing: %s",tmpPath.c_str(),strerror(errno));
    retassure(fwrite(buf, 1, bufLen, saveFile) == bufLen, "Failed to write '%s'",tmpPath.c_str());
    retassure(!fflush(saveFile), "Failed to flush '%s'",tmpPath.c_str());
    fsync(fileno(saveFile));
    {
        FILE *f = saveFile; saveFile = NULL;
        retassure(!fclose(f), "Failed to close '%s'",tmpPath.c_str());
    }
    retassure(!rename(tmpPath.c_str(), dst), "Failed to rename '%s' to '%s': %s",tmpPath.c_str(),dst,strerror(errno));
}

std::string plistjson_to_string(plist_t plist, bool prettify){
    char *buf = NULL;
    cleanup([&]{
        safeFree(buf);
    });
    uint32_t bufLen = 0;
    retassure(!plist_to_json(plist, &buf, &bufLen, prettify) && buf, "Failed to serialize json");
    return std::string(buf,bufLen);
}

plist_t plistjson_from_string(const std::string &json){
    plist_t pl = NULL;
    plist_from_json(json.c_str(), (uint32_t)json.size(), &pl);
    retassure(pl, "failed to parse json");
    return pl;
}

#pragma mark dict accessors
std::optional<std::string> plistjson_dict_string(plist_t dict, const char *key){
    plist_t p_val = NULL;
    const char *str = NULL;
    uint64_t str_len = 0;
    if (!(p_val = plist_dict_get_item(dict, key))) return std::nullopt;
    if (plist_get_node_type(p_val) == PLIST_NULL) return std::nullopt;
    retassure(plist_get_node_type(p_val) == PLIST_STRING, "'%s' is not a string",key);
    retassure(str = plist_get_string_ptr(p_val, &str_len), "Failed to get str ptr for '%s'",key);
    return std::string(str,str_len);
}

std::optional<int64_t> plistjson_dict_int(plist_t dict, const char *key){
    plist_t p_val = NULL;
    int64_t val = 0;
    if (!(p_val = plist_dict_get_item(dict, key))) return std::nullopt;
    if (plist_get_node_type(p_val) == PLIST_NULL) return std::nullopt;
    retassure(plist_get_node_type(p_val) == PLIST_INT, "'%s' is not an integer",key);
    plist_get_int_val(p_val, &val);
    return val;
}

std::optional<bool> plistjson_dict_bool(plist_t dict, const char *key){
    plist_t p_val = NULL;
    if (!(p_val = plist_dict_get_item(dict, key))) return std::nullopt;
    if (plist_get_node_type(p_val) == PLIST_NULL) return std::nullopt;
    retassure(plist_get_node_type(p_val) == PLIST_BOOLEAN, "'%s' is not a bool",key);
    return plist_bool_val_is_true(p_val);
}

std::vector<std::string> plistjson_dict_string_array(plist_t dict, const char *key){
    std::vector<std::string> ret;
    plist_t p_arr = NULL;
    if (!(p_arr = plist_dict_get_item(dict, key))) return ret;
    if (plist_get_node_type(p_arr) == PLIST_NULL) return ret;
    retassure(plist_get_node_type(p_arr) == PLIST_ARRAY, "'%s' is not an array",key);
    for (uint32_t i = 0; i < plist_array_get_size(p_arr); i++) {
        plist_t p_item = plist_array_get_item(p_arr, i);
        const char *str = NULL;
        uint64_t str_len = 0;
        retassure(plist_get_node_type(p_item) == PLIST_STRING, "'%s'[%u] is not a string",key,i);
        retassure(str = plist_get_string_ptr(p_item, &str_len), "Failed to get str ptr for '%s'[%u]",key,i);
        ret.push_back(std::string(str,str_len));
    }
    return ret;
}

std::map<std::string,std::string> plistjson_dict_string_map(plist_t dict, const char *key){
    std::map<std::string,std::string> ret;
    plist_t p_dict = NULL;
    plist_dict_iter iter = NULL;
    cleanup([&]{
        safeFree(iter);
    });
    if (!(p_dict = plist_dict_get_item(dict, key))) return ret;
    if (plist_get_node_type(p_dict) == PLIST_NULL) return ret;
    retassure(plist_get_node_type(p_dict) == PLIST_DICT, "'%s' is not an object",key);

    plist_dict_new_iter(p_dict, &iter);
    assure(iter);
    while (true) {
        char *ikey = NULL;
        cleanup([&]{
            safeFree(ikey);
        });
        plist_t p_item = NULL;
        const char *str = NULL;
        uint64_t str_len = 0;
        plist_dict_next_item(p_dict, iter, &ikey, &p_item);
        if (!p_item) break;
        retassure(plist_get_node_type(p_item) == PLIST_STRING, "'%s.%s' is not a string",key,ikey);
        retassure(str = plist_get_string_ptr(p_item, &str_len), "Failed to get str ptr for '%s.%s'",key,ikey);
        ret[ikey] = std::string(str,str_len);
    }
    return ret;
}

void plistjson_dict_set_string(plist_t dict, const char *key, const std::string &val){
    plist_dict_set_item(dict, key, plist_new_string(val.c_str()));
}

void plistjson_dict_set_int(plist_t dict, const char *key, int64_t val){
    plist_dict_set_item(dict, key, plist_new_int(val));
}

void plistjson_dict_set_bool(plist_t dict, const char *key, bool val){
    plist_dict_set_item(dict, key, plist_new_bool(val));
}

void plistjson_dict_set_string_array(plist_t dict, const char *key, const std::vector<std::string> &val){
    plist_t p_arr = plist_new_array();
    for (auto &s : val) plist_array_append_item(p_arr, plist_new_string(s.c_str()));
    plist_dict_set_item(dict, key, p_arr);
}

void plistjson_dict_set_string_map(plist_t dict, const char *key, const std::map<std::string,std::string> &val){
    plist_t p_dict = plist_new_dict();
    for (auto &kv : val) plist_dict_set_item(p_dict, kv.first.c_str(), plist_new_string(kv.second.c_str()));
    plist_dict_set_item(dict, key, p_dict);
}
