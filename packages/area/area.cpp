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
 *INCLUDES
 ******************************************************************************/

#include "core.h"
#include "area.h"

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#define LUA_AREA_LIBNAME  "area"

/******************************************************************************
 * AREA FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * area_open
 *----------------------------------------------------------------------------*/
int area_open (lua_State* L)
{
    static const struct luaL_Reg area_functions[] = {
        {"parms",           AreaParms::luaCreate},
#ifdef __unittesting__
        {"ut_lookup",       UT_ClassLookup::luaCreate},
        {"ut_matrix",       UT_AreaMatrix::luaCreate},
        {"ut_aggregators",  UT_Aggregators::luaCreate},
#endif
        {NULL,              NULL}
    };

    /* Set Package Library */
    luaL_newlib(L, area_functions);

    /* Set Globals */
    LuaEngine::setAttrStr   (L, "KG",           ClassLookup::KG);
    LuaEngine::setAttrStr   (L, "ESA_LC",       ClassLookup::ESA_LC);
    LuaEngine::setAttrStr   (L, "FAO_LC",       ClassLookup::FAO_LC);
    LuaEngine::setAttrStr   (L, "SLOPE",        ClassLookup::SLOPE);
    LuaEngine::setAttrStr   (L, "WORKABILITY",  ClassLookup::WORKABILITY);
    LuaEngine::setAttrStr   (L, "CLIP",         AreaParms::CLIP_METHOD);
    LuaEngine::setAttrStr   (L, "MASK",         AreaParms::MASK_METHOD);

    return 1;
}

/******************************************************************************
 * EXPORTED FUNCTIONS
 ******************************************************************************/
extern "C" {
void initarea (void)
{
    /* Extend Lua */
    LuaEngine::extend(LUA_AREA_LIBNAME, area_open);

    /* Indicate Presence of Package */
    LuaEngine::indicate(LUA_AREA_LIBNAME, LIBID);

    /* Display Status */
    mlog(INFO, "%s package initialized (%s)", LUA_AREA_LIBNAME, LIBID);
}

void deinitarea (void)
{
}
}
