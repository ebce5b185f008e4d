/** \file    FileUtil.cc
 *  \brief   Implementation of file-related utility functions.
 *
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "FileUtil.h"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <cerrno>
#include <climits>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>
#include "Compiler.h"
#include "util.h"


namespace FileUtil {


bool ReadString(const std::string &path, std::string * const data) {
    std::ifstream input(path, std::ios_base::in | std::ios_base::binary);
    if (input.fail())
        return false;

    data->assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    return not input.bad();
}


std::string ReadStringOrDie(const std::string &path) {
    std::string data;
    if (not FileUtil::ReadString(path, &data))
        LOG_ERROR("failed to read \"" + path + "\"!");
    return data;
}


bool Exists(const std::string &path, std::string * const error_message) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) != 0) {
        if (error_message != nullptr)
            *error_message = "can't stat(2) \"" + path + "\": " + std::string(std::strerror(errno));
        return false;
    }

    return true;
}


void DirnameAndBasename(const std::string &path, std::string * const dirname, std::string * const basename) {
    if (unlikely(path.length() == 0)) {
        dirname->clear();
        basename->clear();
        return;
    }

    const std::string::size_type last_slash_pos(path.rfind('/'));
    if (last_slash_pos == std::string::npos) {
        dirname->clear();
        *basename = path;
    } else {
        *dirname = path.substr(0, last_slash_pos);
        *basename = path.substr(last_slash_pos + 1);
    }
}


std::string MakeAbsolutePath(const std::string &reference_directory, const std::string &relative_path) {
    if (not relative_path.empty() and relative_path[0] == '/')
        return relative_path;

    std::string directory(reference_directory);
    if (directory.empty()) {
        char buf[PATH_MAX];
        const char * const current_working_dir(::getcwd(buf, sizeof buf));
        if (unlikely(current_working_dir == nullptr))
            throw std::runtime_error("in FileUtil::MakeAbsolutePath: getcwd(3) failed (" + std::string(std::strerror(errno)) + ")!");
        directory = current_working_dir;
    }

    if (directory.back() != '/')
        directory += '/';
    return directory + relative_path;
}


} // namespace FileUtil
