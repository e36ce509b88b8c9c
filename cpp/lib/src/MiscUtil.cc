/** \file    MiscUtil.cc
 *  \brief   Implementation of miscellaneous utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2016-2024 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "MiscUtil.h"
#include <stdexcept>
#include <cstdlib>
#include "Compiler.h"


namespace MiscUtil {


std::string GetEnv(const std::string &name) {
    const char * const value(::getenv(name.c_str()));
    if (value == nullptr)
        throw std::runtime_error("in MiscUtil::GetEnv: ::getenv(\"" + name + "\") failed!");

    return value;
}


std::string SafeGetEnv(const std::string &name) {
    const char * const value(::getenv(name.c_str()));
    return value == nullptr ? "" : value;
}


bool EnvironmentVariableExists(const std::string &name) {
    return ::getenv(name.c_str()) != nullptr;
}


void SetEnv(const std::string &name, const std::string &value, const bool overwrite) {
    if (unlikely(::setenv(name.c_str(), value.c_str(), overwrite ? 1 : 0) != 0))
        throw std::runtime_error("in MiscUtil::SetEnv: setenv(3) failed!");
}


void UnsetEnv(const std::string &name) {
    if (unlikely(::unsetenv(name.c_str()) != 0))
        throw std::runtime_error("in MiscUtil::UnsetEnv: unsetenv(3) failed for \"" + name + "\"!");
}


} // namespace MiscUtil
