#include "segx_output.h"

#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <iostream>

std::string segx_base_name(const std::string& name) {
    size_t slash = name.find_last_of('/');
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

bool segx_save_file(const std::string& dir, const std::string& name, const std::vector<uint8_t>& data,
                    std::string* saved_path) {
    if (::mkdir(dir.c_str(), 0755) < 0 && errno != EEXIST) {
        perror("mkdir");
        return false;
    }

    std::string base = segx_base_name(name);
    if (base.empty()) {
        std::cerr << "No file name in " << name << "\n";
        return false;
    }

    std::string path = dir + "/" + base;
    std::string part = path + ".part";

    {
        std::ofstream ofs(part, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            std::cerr << "Failed to open output file: " << part << "\n";
            return false;
        }

        ofs.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
        ofs.close();
        if (!ofs) {
            std::cerr << "Error writing " << part << "\n";
            ::unlink(part.c_str());
            return false;
        }
    }

    if (std::rename(part.c_str(), path.c_str()) != 0) {
        perror("rename");
        ::unlink(part.c_str());
        return false;
    }

    if (saved_path) *saved_path = path;
    return true;
}
