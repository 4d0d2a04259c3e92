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

#ifndef __scratch_dir__
#define __scratch_dir__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"

#include <string>

/******************************************************************************
 * SCRATCH DIRECTORY CLASS
 *
 *  Uniquely named temporary directory that is removed, with everything in
 *  it, when the object goes out of scope
 ******************************************************************************/

class ScratchDir
{
    public:

        explicit            ScratchDir  (const char* prefix="regionarea");
                            ~ScratchDir (void);

        const std::string&  getPath     (void) const { return path; }
        std::string         file        (const std::string& name) const;

    private:

        std::string path;

        ScratchDir (const ScratchDir&);
        ScratchDir& operator= (const ScratchDir&);
};

/******************************************************************************
 * SCRATCH FILE CLASS
 *
 *  Deletes a dataset written to scratch space when it goes out of scope
 ******************************************************************************/

class ScratchFile
{
    public:

                            ScratchFile (const std::string& _fileName, const char* _driverName);
                            ~ScratchFile(void);

        const std::string&  getName     (void) const { return fileName; }

    private:

        std::string fileName;
        const char* driverName;

        ScratchFile (const ScratchFile&);
        ScratchFile& operator= (const ScratchFile&);
};

#endif  /* __scratch_dir__ */
