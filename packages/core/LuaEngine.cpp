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

#include "LuaEngine.h"
#include "OsApi.h"
#include "EventLib.h"
#include "StringLib.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* LuaEngine::LUA_SELFKEY = "_this";

std::vector<LuaEngine::libInitEntry_t> LuaEngine::libInitTable;
Mutex LuaEngine::libInitTableMutex;
std::vector<LuaEngine::pkgInitEntry_t> LuaEngine::pkgInitTable;
Mutex LuaEngine::pkgInitTableMutex;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
LuaEngine::LuaEngine(const char* name):
    L(NULL),
    engineName(name ? name : "lua")
{
    L = createState();
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
LuaEngine::~LuaEngine(void)
{
    if(L) lua_close(L);
}

/*----------------------------------------------------------------------------
 * extend
 *----------------------------------------------------------------------------*/
void LuaEngine::extend(const char* lib_name, luaOpenLibFunc lib_func)
{
    libInitTableMutex.lock();
    {
        libInitEntry_t entry;
        entry.lib_name = lib_name;
        entry.lib_func = lib_func;
        libInitTable.push_back(entry);
    }
    libInitTableMutex.unlock();
}

/*----------------------------------------------------------------------------
 * indicate
 *----------------------------------------------------------------------------*/
void LuaEngine::indicate(const char* pkg_name, const char* pkg_version)
{
    pkgInitTableMutex.lock();
    {
        pkgInitEntry_t entry;
        entry.pkg_name = pkg_name;
        entry.pkg_version = pkg_version;
        pkgInitTable.push_back(entry);
    }
    pkgInitTableMutex.unlock();
}

/*----------------------------------------------------------------------------
 * setAttrBool
 *----------------------------------------------------------------------------*/
void LuaEngine::setAttrBool (lua_State* l, const char* name, bool val)
{
    lua_pushstring(l, name);
    lua_pushboolean(l, val);
    lua_settable(l, -3);
}

/*----------------------------------------------------------------------------
 * setAttrInt
 *----------------------------------------------------------------------------*/
void LuaEngine::setAttrInt (lua_State* l, const char* name, int val)
{
    lua_pushstring(l, name);
    lua_pushinteger(l, val);
    lua_settable(l, -3);
}

/*----------------------------------------------------------------------------
 * setAttrStr
 *----------------------------------------------------------------------------*/
void LuaEngine::setAttrStr (lua_State* l, const char* name, const char* val, int size)
{
    lua_pushstring(l, name);
    if(size > 0)    lua_pushlstring(l, val, size);
    else            lua_pushstring(l, val);
    lua_settable(l, -3);
}

/*----------------------------------------------------------------------------
 * setAttrFunc
 *----------------------------------------------------------------------------*/
void LuaEngine::setAttrFunc (lua_State* l, const char* name, lua_CFunction val)
{
    lua_pushstring(l, name);
    lua_pushcfunction(l, val);
    lua_settable(l, -3);
}

/*----------------------------------------------------------------------------
 * getName
 *----------------------------------------------------------------------------*/
const char* LuaEngine::getName(void) const
{
    return engineName.c_str();
}

/*----------------------------------------------------------------------------
 * getState
 *----------------------------------------------------------------------------*/
lua_State* LuaEngine::getState(void)
{
    return L;
}

/*----------------------------------------------------------------------------
 * executeScript
 *
 *  Runs the script in protected mode; the first value returned by the
 *  script is left on the top of the stack for the caller
 *----------------------------------------------------------------------------*/
void LuaEngine::executeScript(const char* script, int argc, const char* const* argv)
{
    if(script == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "no script supplied to %s", getName());
    }

    setScriptPath(script);

    /* Set Script Arguments */
    lua_createtable(L, argc, 1);
    lua_pushstring(L, script);
    lua_rawseti(L, -2, 0);
    for(int i = 0; i < argc; i++)
    {
        lua_pushstring(L, argv[i]);
        lua_rawseti(L, -2, i + 1);
    }
    lua_setglobal(L, "arg");

    /* Load and Run Script */
    int status = luaL_loadfile(L, script);
    if(status == LUA_OK)
    {
        for(int i = 0; i < argc; i++) lua_pushstring(L, argv[i]);
        status = docall(argc, 1);
    }

    if(status != LUA_OK)
    {
        const char* errmsg = lua_tostring(L, -1);
        const std::string msg = errmsg ? errmsg : "unknown error";
        lua_pop(L, 1);
        throw RunTimeException(CRITICAL, RTE_ERROR, "%s: %s", getName(), msg.c_str());
    }

    mlog(DEBUG, "Executed %s", script);
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * createState
 *----------------------------------------------------------------------------*/
lua_State* LuaEngine::createState(void)
{
    /* Initialize Lua */
    lua_State* l = luaL_newstate();
    if(l == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "not enough memory to create lua state");
    }

    /* Register Interpreter Object */
    lua_pushstring(l, LUA_SELFKEY);
    lua_pushlightuserdata(l, (void *)this);
    lua_settable(l, LUA_REGISTRYINDEX); /* registry[LUA_SELFKEY] = this */

    /* Open Libraries */
    lua_pushboolean(l, 1);  /* signal for libraries to ignore env. vars. */
    lua_setfield(l, LUA_REGISTRYINDEX, "LUA_NOENV");
    luaL_openlibs(l);

    /* Register Application Libraries */
    libInitTableMutex.lock();
    {
        for(const libInitEntry_t& entry : libInitTable)
        {
            luaL_requiref(l, entry.lib_name.c_str(), entry.lib_func, 1);
            lua_pop(l, 1);
        }
    }
    libInitTableMutex.unlock();

    /* Register Package Versions */
    pkgInitTableMutex.lock();
    {
        for(const pkgInitEntry_t& entry : pkgInitTable)
        {
            char pkg_name[MAX_STR_SIZE];
            StringLib::format(pkg_name, MAX_STR_SIZE, "__%s__", entry.pkg_name.c_str());
            lua_pushstring(l, entry.pkg_version.c_str());
            lua_setglobal(l, pkg_name);
        }
    }
    pkgInitTableMutex.unlock();

    return l;
}

/*----------------------------------------------------------------------------
 * setScriptPath
 *
 *  Lets scripts require modules that sit beside them
 *----------------------------------------------------------------------------*/
void LuaEngine::setScriptPath(const char* script)
{
    std::string dir = ".";
    const char* last_path_delimeter = StringLib::find(script, PATH_DELIMETER, false);
    if(last_path_delimeter) dir = std::string(script, last_path_delimeter - script);

    const std::string lpath = dir + PATH_DELIMETER_STR + "?.lua";
    lua_getglobal(L, "package");
    lua_pushstring(L, lpath.c_str());
    lua_setfield(L, -2, "path");
    lua_pop(L, 1);
}

/*----------------------------------------------------------------------------
 * msghandler
 *
 *  Message handler used to run all chunks
 *----------------------------------------------------------------------------*/
int LuaEngine::msghandler (lua_State* l)
{
    const char *msg = lua_tostring(l, 1);
    if (msg == NULL)
    {
        /* does it have a metamethod that produces a string? */
        if (luaL_callmeta(l, 1, "__tostring") && lua_type(l, -1) == LUA_TSTRING)
        {
            return 1;  /* that is the message */
        }
        else
        {
            msg = lua_pushfstring(l, "(error object is a %s value)", luaL_typename(l, 1));
        }
    }
    luaL_traceback(l, l, msg, 1);  /* append a standard traceback */
    return 1;  /* return the traceback */
}

/*----------------------------------------------------------------------------
 * docall
 *
 *  Interface to 'lua_pcall', which sets appropriate message function
 *----------------------------------------------------------------------------*/
int LuaEngine::docall (int narg, int nres)
{
    const int base = lua_gettop(L) - narg;  /* function index */
    lua_pushcfunction(L, msghandler);  /* push message handler */
    lua_insert(L, base);  /* put it under function and args */
    const int status = lua_pcall(L, narg, nres, base);
    lua_remove(L, base);  /* remove message handler from the stack */
    return status;
}
