/** \file    FileUtil.h
 *  \brief   File-related utility functions.
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
#pragma once


#include <string>


namespace FileUtil {


/** \brief  Reads the entire contents of "path" into "data".
 *  \return False if the file could not be opened or read, else true.
 */
bool ReadString(const std::string &path, std::string * const data);


// Calls LOG_ERROR if the file can't be read.
std::string ReadStringOrDie(const std::string &path);


/** \return True if "path" exists, else false.  If "error_message" is non-NULL it will be set to the reason of a failure. */
bool Exists(const std::string &path, std::string * const error_message = nullptr);


/** \brief  Splits "path" into the part up to the last slash and the part after it. */
void DirnameAndBasename(const std::string &path, std::string * const dirname, std::string * const basename);


/** \brief  Interprets "relative_path" relative to the directory "reference_directory".
 *  \note   Absolute "relative_path" arguments are returned unchanged.  An empty reference directory means the current
 *          working directory.
 */
std::string MakeAbsolutePath(const std::string &reference_directory, const std::string &relative_path);


} // namespace FileUtil
