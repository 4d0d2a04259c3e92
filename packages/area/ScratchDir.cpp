/*
 * Copyright (c) 2021, University of Washington
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the University of Washington nor the names of its
 *    contributors may be used to endorse or promote products derived from this
 *    software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE UNIVERSITY OF WASHINGTON AND CONTRIBUTORS
 * “AS IS” AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE UNIVERSITY OF WASHINGTON OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "ScratchDir.h"
#include "GeoLib.h"
#include "EventLib.h"

#include <cpl_conv.h>
#include <cpl_vsi.h>

/******************************************************************************
 * SCRATCH DIRECTORY METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
ScratchDir::ScratchDir(const char* prefix)
{
    const char* tmpdir = CPLGetConfigOption("CPL_TMPDIR", NULL);
    if(tmpdir == NULL) tmpdir = "/tmp";

    path = std::string(tmpdir) + PATH_DELIMETER_STR + prefix + "-" + GeoLib::getUUID();
    if(VSIMkdir(path.c_str(), 0755) != 0)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to create scratch directory: %s", path.c_str());
    }

    mlog(DEBUG, "Created scratch directory %s", path.c_str());
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
ScratchDir::~ScratchDir(void)
{
    if(VSIRmdirRecursive(path.c_str()) != 0)
    {
        mlog(WARNING, "Failed to remove scratch directory %s", path.c_str());
    }
    else
    {
        mlog(DEBUG, "Removed scratch directory %s", path.c_str());
    }
}

/*----------------------------------------------------------------------------
 * file
 *----------------------------------------------------------------------------*/
std::string ScratchDir::file(const std::string& name) const
{
    return path + PATH_DELIMETER_STR + name;
}

/******************************************************************************
 * SCRATCH FILE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
ScratchFile::ScratchFile(const std::string& _fileName, const char* _driverName):
    fileName(_fileName),
    driverName(_driverName)
{
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
ScratchFile::~ScratchFile(void)
{
    GeoLib::deleteDataset(fileName, driverName);
}
