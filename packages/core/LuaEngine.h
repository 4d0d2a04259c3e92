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

#ifndef __lua_engine__
#define __lua_engine__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "EventLib.h"
#include "StringLib.h"

#include <string>
#include <vector>

extern "C"
{
#include <lua.h>
#include <lauxlib.h>
#include <lualib.h>
}

/******************************************************************************
 * LUA ENGINE CLASS
 ******************************************************************************/

class LuaEngine
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* LUA_SELFKEY;
        static const int MAX_LUA_ARG = MAX_STR_SIZE;

        /*--------------------------------------------------------------------
         * Types
         *--------------------------------------------------------------------*/

        typedef int (*luaOpenLibFunc) (lua_State* L);

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit            LuaEngine       (const char* name);
                            ~LuaEngine      (void);

        static void         extend          (const char* lib_name, luaOpenLibFunc lib_func);
        static void         indicate        (const char* pkg_name, const char* pkg_version);
        static void         setAttrBool     (lua_State* l, const char* name, bool val);
        static void         setAttrInt      (lua_State* l, const char* name, int val);
        static void         setAttrStr      (lua_State* l, const char* name, const char* val, int size=0);
        static void         setAttrFunc     (lua_State* l, const char* name, lua_CFunction val);

        const char*         getName         (void) const;
        lua_State*          getState        (void);
        void                executeScript   (const char* script, int argc=0, const char* const* argv=NULL);

    private:

        /*--------------------------------------------------------------------
         * Types
         *--------------------------------------------------------------------*/

        typedef struct {
            std::string     lib_name;
            luaOpenLibFunc  lib_func;
        } libInitEntry_t;

        typedef struct {
            std::string     pkg_name;
            std::string     pkg_version;
        } pkgInitEntry_t;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        static std::vector<libInitEntry_t>  libInitTable;
        static Mutex                        libInitTableMutex;

        static std::vector<pkgInitEntry_t>  pkgInitTable;
        static Mutex                        pkgInitTableMutex;

        lua_State*                          L;      // lua state variable
        std::string                         engineName;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        lua_State*      createState         (void);
        void            setScriptPath       (const char* script);
        static int      msghandler          (lua_State* L);
        int             docall              (int narg, int nres);
};

#endif  /* __lua_engine__ */
