/** \file   FileUtil.cc
 *  \brief  Implementation of file related utility classes and functions.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *  \author Steven Lolong (steven.lolong@uni-tuebingen.de)
 *
 *  \copyright 2015-2023 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include <sys/stat.h>
#include "StringUtil.h"
#include "util.h"


namespace FileUtil {


AutoTempFile::AutoTempFile(const std::string &path_prefix, const std::string &path_suffix, bool automatically_remove)
    : automatically_remove_(automatically_remove) {
    std::string path_template(path_prefix + "XXXXXX" + path_suffix);
    const int fd(::mkstemps(const_cast<char *>(path_template.c_str()), path_suffix.length()));
    if (fd == -1)
        LOG_ERROR("mkstemps(3) for path prefix \"" + path_prefix + "\" failed!");

    ::close(fd);
    path_ = path_template;
}


bool Exists(const std::string &path) {
    struct stat stat_buf;
    return ::stat(path.c_str(), &stat_buf) == 0;
}


bool WriteString(const std::string &path, const std::string &data) {
    std::ofstream output(path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (output.fail())
        return false;

    output.write(data.data(), data.size());
    return not output.bad();
}


void WriteStringOrDie(const std::string &path, const std::string &data) {
    if (not FileUtil::WriteString(path, data))
        LOG_ERROR("failed to write data to \"" + path + "\"!");
}


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


bool ReadLines(const std::string &path, std::vector<std::string> * const lines) {
    lines->clear();

    std::ifstream input(path, std::ios_base::in);
    if (input.fail())
        return false;

    std::string line;
    while (std::getline(input, line)) {
        StringUtil::RightTrim('\r', &line);
        lines->emplace_back(line);
    }

    return not input.bad();
}


} // namespace FileUtil
