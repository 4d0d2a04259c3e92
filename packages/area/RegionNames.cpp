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

#include "RegionNames.h"
#include "EventLib.h"

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * addAlias
 *----------------------------------------------------------------------------*/
void RegionNames::addAlias(const std::string& raw, const std::string& canonical)
{
    if(raw.empty())
        throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "region alias must have a name");

    /* an empty canonical name drops the region */
    if(canonical.empty())
    {
        addExclusion(raw);
        return;
    }

    aliases[raw] = canonical;
}

/*----------------------------------------------------------------------------
 * addExclusion
 *----------------------------------------------------------------------------*/
void RegionNames::addExclusion(const std::string& raw)
{
    exclusions.insert(raw);
}

/*----------------------------------------------------------------------------
 * lookup
 *----------------------------------------------------------------------------*/
bool RegionNames::lookup(const char* raw, std::string& canonical) const
{
    if(raw == NULL || raw[0] == '\0') return false;

    const std::string name(raw);
    if(exclusions.find(name) != exclusions.end())
    {
        return false;
    }

    const auto iter = aliases.find(name);
    if(iter != aliases.end()) canonical = iter->second;
    else                      canonical = name;

    return true;
}
