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

#include "EventLib.h"
#include "StringLib.h"
#include "OsApi.h"

#include <stdarg.h>
#include <strings.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

event_level_t EventLib::log_level = INFO;
FILE* EventLib::output = NULL;
Mutex EventLib::outputMut;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * init
 *----------------------------------------------------------------------------*/
void EventLib::init (FILE* _output)
{
    outputMut.lock();
    {
        output = _output ? _output : stderr;
    }
    outputMut.unlock();
}

/*----------------------------------------------------------------------------
 * deinit
 *----------------------------------------------------------------------------*/
void EventLib::deinit (void)
{
    outputMut.lock();
    {
        if(output) fflush(output);
        output = NULL;
    }
    outputMut.unlock();
}

/*----------------------------------------------------------------------------
 * setLvl
 *----------------------------------------------------------------------------*/
void EventLib::setLvl (event_level_t lvl)
{
    log_level = lvl;
}

/*----------------------------------------------------------------------------
 * lvl2str
 *----------------------------------------------------------------------------*/
const char* EventLib::lvl2str (event_level_t lvl)
{
    switch(lvl)
    {
        case DEBUG:     return "DEBUG";
        case INFO:      return "INFO";
        case WARNING:   return "WARNING";
        case ERROR:     return "ERROR";
        case CRITICAL:  return "CRITICAL";
        default:        return NULL;
    }
}

/*----------------------------------------------------------------------------
 * str2lvl
 *----------------------------------------------------------------------------*/
event_level_t EventLib::str2lvl (const char* str)
{
    if(str == NULL)                     return INVALID_EVENT_LEVEL;
    if(strcasecmp(str, "DEBUG") == 0)   return DEBUG;
    if(strcasecmp(str, "INFO") == 0)    return INFO;
    if(strcasecmp(str, "WARNING") == 0) return WARNING;
    if(strcasecmp(str, "ERROR") == 0)   return ERROR;
    if(strcasecmp(str, "CRITICAL") == 0)return CRITICAL;
    return INVALID_EVENT_LEVEL;
}

/*----------------------------------------------------------------------------
 * logMsg
 *----------------------------------------------------------------------------*/
void EventLib::logMsg(const char* file_name, unsigned int line_number, event_level_t lvl, const char* msg_fmt, ...)
{
    event_t event;

    /* Return Here If Nothing to Do */
    if(lvl < log_level) return;

    /* Initialize Log Message */
    event.systime   = OsApi::time(OsApi::SYS_CLK);
    event.tid       = Thread::getId();
    event.level     = lvl;

    /* Build Name - <Filename>:<Line Number> */
    const char* last_path_delimeter = StringLib::find(file_name, PATH_DELIMETER, false);
    const char* file_name_only = last_path_delimeter ? last_path_delimeter + 1 : file_name;
    StringLib::format(event.name, MAX_NAME_SIZE, "%s:%d", file_name_only, line_number);

    /* Build Attribute - <log message> */
    va_list args;
    va_start(args, msg_fmt);
    const int vlen = vsnprintf(event.attr, MAX_ATTR_SIZE - 1, msg_fmt, args);
    const int attr_size = MAX(MIN(vlen + 1, MAX_ATTR_SIZE), 1);
    event.attr[attr_size - 1] = '\0';
    va_end(args);

    /* Write Event */
    writeEvent(&event);
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * writeEvent
 *----------------------------------------------------------------------------*/
void EventLib::writeEvent (const event_t* event)
{
    const char* lvlstr = lvl2str((event_level_t)event->level);
    const double elapsed = (double)(event->systime - OsApi::getLaunchTime()) / (double)OsApi::timeres(OsApi::SYS_CLK);

    outputMut.lock();
    {
        FILE* fp = output ? output : stderr;
        fprintf(fp, "[%.3lf] %s %s (%ld): %s\n", elapsed, lvlstr ? lvlstr : "UNKNOWN", event->name, (long)event->tid, event->attr);
        fflush(fp);
    }
    outputMut.unlock();
}
