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

#include <cmath>
#include <limits>

#include "UT_AreaMatrix.h"
#include "AreaMatrix.h"
#include "AreaWriter.h"
#include "ScratchDir.h"
#include "UnitTest.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_AreaMatrix::LUA_META_NAME = "UT_AreaMatrix";
const struct luaL_Reg UT_AreaMatrix::LUA_META_TABLE[] = {
    {"accumulate",  testAccumulate},
    {"merge",       testMerge},
    {"csv",         testCsv},
    {NULL,          NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

static std::vector<class_key_t> abColumns (void)
{
    std::vector<class_key_t> columns;
    columns.push_back("A");
    columns.push_back("B");
    return columns;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate -
 *----------------------------------------------------------------------------*/
int UT_AreaMatrix::luaCreate (lua_State* L)
{
    try
    {
        /* Create Unit Test */
        return createLuaObject(L, new UT_AreaMatrix(L));
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error creating %s: %s", LUA_META_NAME, e.what());
        return returnLuaStatus(L, false);
    }
}

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_AreaMatrix::UT_AreaMatrix (lua_State* L):
    UnitTest(L, LUA_META_NAME, LUA_META_TABLE)
{
}

/*--------------------------------------------------------------------------------------
 * testAccumulate
 *--------------------------------------------------------------------------------------*/
int UT_AreaMatrix::testAccumulate(lua_State* L)
{
    UT_AreaMatrix* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_AreaMatrix*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    AreaMatrix matrix(abColumns());

    // 1) Rows start at zero and creating them twice changes nothing
    matrix.ensureRegion("France");
    matrix.ensureRegion("France");
    ut_assert(lua_obj, matrix.numRegions() == 1, "Unexpected number of regions: %d", matrix.numRegions());
    ut_assert(lua_obj, matrix.get("France", "A") == 0.0 && matrix.get("France", "B") == 0.0, "New row is not zero");

    // 2) Accumulation is additive
    matrix.add("France", "A", 1.5);
    matrix.add("France", "A", 2.25);
    matrix.add("France", "B", 4.0);
    ut_assert(lua_obj, matrix.get("France", "A") == 3.75, "Unexpected sum: %lf", matrix.get("France", "A"));
    ut_assert(lua_obj, matrix.total("France") == 7.75, "Unexpected total: %lf", matrix.total("France"));

    // 3) Adding to a new region creates its row
    matrix.add("Spain", "B", 1.0);
    ut_assert(lua_obj, matrix.hasRegion("Spain"), "Row not created on add");
    ut_assert(lua_obj, matrix.get("Spain", "A") == 0.0, "Unexpected value in new row");

    // 4) Unknown classes, negative and non-finite areas are ignored
    matrix.add("France", "C", 10.0);
    matrix.add("France", "A", -1.0);
    matrix.add("France", "A", std::numeric_limits<double>::quiet_NaN());
    matrix.add("France", "A", std::numeric_limits<double>::infinity());
    matrix.add("Italy", "C", 10.0);
    ut_assert(lua_obj, matrix.get("France", "A") == 3.75, "Invalid area was accumulated: %lf", matrix.get("France", "A"));
    ut_assert(lua_obj, !matrix.hasRegion("Italy"), "Row created for an unknown class");
    ut_assert(lua_obj, matrix.get("France", "C") == 0.0, "Unknown class has a value");

    // 5) Serialized rows are in ascending region order
    matrix.ensureRegion("Andorra");
    const std::vector<AreaMatrix::row_t> rows = matrix.serialize();
    ut_assert(lua_obj, rows.size() == 3, "Unexpected number of rows: %ld", (long)rows.size());
    if(rows.size() == 3)
    {
        ut_assert(lua_obj, rows[0].region == "Andorra" && rows[1].region == "France" && rows[2].region == "Spain", "Rows out of order");
        ut_assert(lua_obj, rows[1].values.size() == 2 && rows[1].values[1] == 4.0, "Unexpected row values");
    }

    // 6) Duplicate columns are rejected
    bool caught = false;
    try
    {
        std::vector<class_key_t> columns = abColumns();
        columns.push_back("A");
        const AreaMatrix duplicate(columns);
    }
    catch(const RunTimeException&)
    {
        caught = true;
    }
    ut_assert(lua_obj, caught, "Duplicate column was accepted");

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testMerge
 *--------------------------------------------------------------------------------------*/
int UT_AreaMatrix::testMerge(lua_State* L)
{
    UT_AreaMatrix* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_AreaMatrix*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        AreaMatrix left(abColumns());
        AreaMatrix right(abColumns());
        AreaMatrix both(abColumns());

        left.add("Chile", "A", 1.0);
        left.ensureRegion("Peru");
        right.add("Chile", "A", 2.0);
        right.add("Chile", "B", 3.0);
        right.add("Bolivia", "B", 5.0);

        both.merge(left);
        both.merge(right);

        // 1) Cells are summed and rows are the union
        ut_assert(lua_obj, both.numRegions() == 3, "Unexpected number of regions: %d", both.numRegions());
        ut_assert(lua_obj, both.get("Chile", "A") == 3.0, "Unexpected merged value: %lf", both.get("Chile", "A"));
        ut_assert(lua_obj, both.get("Chile", "B") == 3.0, "Unexpected merged value: %lf", both.get("Chile", "B"));
        ut_assert(lua_obj, both.get("Bolivia", "B") == 5.0, "Unexpected merged value: %lf", both.get("Bolivia", "B"));
        ut_assert(lua_obj, both.hasRegion("Peru") && both.total("Peru") == 0.0, "Empty row not merged");

        // 2) Merge order does not matter
        AreaMatrix reversed(abColumns());
        reversed.merge(right);
        reversed.merge(left);
        const std::vector<AreaMatrix::row_t> a = both.serialize();
        const std::vector<AreaMatrix::row_t> b = reversed.serialize();
        ut_assert(lua_obj, a.size() == b.size(), "Merge order changed number of rows");
        for(size_t i = 0; i < a.size() && i < b.size(); i++)
        {
            ut_assert(lua_obj, a[i].region == b[i].region && a[i].values == b[i].values, "Merge order changed row %s", a[i].region.c_str());
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // 3) Columns must match
    bool caught = false;
    try
    {
        std::vector<class_key_t> columns;
        columns.push_back("B");
        columns.push_back("A");
        AreaMatrix target(abColumns());
        const AreaMatrix other(columns);
        target.merge(other);
    }
    catch(const RunTimeException&)
    {
        caught = true;
    }
    ut_assert(lua_obj, caught, "Merge of mismatched columns was accepted");

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testCsv
 *--------------------------------------------------------------------------------------*/
int UT_AreaMatrix::testCsv(lua_State* L)
{
    UT_AreaMatrix* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_AreaMatrix*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        std::vector<class_key_t> columns;
        columns.push_back("Cropland");
        columns.push_back("Herbaceous vegetation, aquatic or regularly flooded");
        AreaMatrix matrix(columns);
        matrix.add("Zambia", "Cropland", 1234.5678);
        matrix.add("Cote d'Ivoire", "Cropland", 1.25);
        matrix.add("Cote d'Ivoire", "Herbaceous vegetation, aquatic or regularly flooded", 2.0);
        matrix.ensureRegion("Bonaire, Sint Eustatius and Saba");

        // 1) Default format
        const AreaWriter::OutputFormat format;
        const std::string csv = AreaWriter::toCsv(matrix, format);
        const std::string expected =
            "Country,Cropland,\"Herbaceous vegetation, aquatic or regularly flooded\"\n"
            "\"Bonaire, Sint Eustatius and Saba\",0.00,0.00\n"
            "Cote d'Ivoire,1.25,2.00\n"
            "Zambia,1234.57,0.00\n";
        ut_assert(lua_obj, csv == expected, "Unexpected csv:\n%s", csv.c_str());

        // 2) Custom format
        AreaWriter::OutputFormat custom;
        custom.precision = 0;
        custom.delimiter = ';';
        custom.indexName = "Region";
        const std::string csv0 = AreaWriter::toCsv(matrix, custom);
        const std::string expected0 =
            "Region;Cropland;Herbaceous vegetation, aquatic or regularly flooded\n"
            "Bonaire, Sint Eustatius and Saba;0;0\n"
            "Cote d'Ivoire;1;2\n"
            "Zambia;1235;0\n";
        ut_assert(lua_obj, csv0 == expected0, "Unexpected csv:\n%s", csv0.c_str());

        // 3) Quotes inside fields are doubled
        std::vector<class_key_t> quoted;
        quoted.push_back("say \"hi\"");
        AreaMatrix q(quoted);
        q.add("X", "say \"hi\"", 1.0);
        const std::string csvq = AreaWriter::toCsv(q, format);
        ut_assert(lua_obj, csvq == "Country,\"say \"\"hi\"\"\"\nX,1.00\n", "Unexpected quoting:\n%s", csvq.c_str());

        // 4) Written file matches the rendered text
        const ScratchDir scratch("ut-matrix");
        const std::string fileName = scratch.file("matrix.csv");
        AreaWriter::write(fileName, matrix, format);
        FILE* fp = fopen(fileName.c_str(), "r");
        ut_assert(lua_obj, fp != NULL, "Output file not created: %s", fileName.c_str());
        if(fp)
        {
            std::string contents;
            char buf[256];
            size_t n;
            while((n = fread(buf, 1, sizeof(buf), fp)) > 0) contents.append(buf, n);
            fclose(fp);
            ut_assert(lua_obj, contents == expected, "Unexpected file contents:\n%s", contents.c_str());
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // 5) Precision is bounded
    bool caught = false;
    try
    {
        AreaWriter::OutputFormat bad;
        bad.precision = -1;
        const AreaMatrix empty(abColumns());
        AreaWriter::toCsv(empty, bad);
    }
    catch(const RunTimeException&)
    {
        caught = true;
    }
    ut_assert(lua_obj, caught, "Negative precision was accepted");

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}
