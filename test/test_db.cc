//
// Created by liuliwu on 2026-10-19.
//

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "common.h"
#include "db.h"
#include "table.h"
#include "test_util.h"

namespace geoLocate::test {

class DbTest : public ::testing::Test {
protected:
    Db db;

    static Location country(const std::string &name) {
        Location loc;
        loc.country = name;
        return loc;
    }
};

TEST_F(DbTest, RegisterTableIsIdempotent) {
    Table *first = db.registerTable("countries");
    Table *second = db.registerTable("countries");
    EXPECT_EQ(first, second);
    EXPECT_EQ(db.getTableNames().size(), 1u);
    EXPECT_TRUE(db.tableExists("countries"));
    EXPECT_FALSE(db.tableExists("provinces"));
    EXPECT_EQ(db.lookupTable("provinces"), nullptr);
}

TEST_F(DbTest, TableNamesAreSorted) {
    db.registerTable("provinces");
    db.registerTable("cities");
    db.registerTable("countries");
    std::vector<std::string> expected = {"cities", "countries", "provinces"};
    EXPECT_EQ(db.getTableNames(), expected);
}

TEST_F(DbTest, RepeatedRegistrationAccumulates) {
    db.registerTable("countries");
    db.put(0, "countries", country("A"), polygonGeometry({rectRing(0, 0, 1, 1)}));
    db.registerTable("countries");
    db.put(1, "countries", country("B"), polygonGeometry({rectRing(2, 2, 3, 3)}));
    EXPECT_EQ(db.lookupTable("countries")->getSize(), 2u);
    EXPECT_EQ(db.getSize(), 2u);
}

TEST_F(DbTest, PutAndLookup) {
    Geometry geometry = polygonGeometry({rectRing(0, 0, 10, 10)});
    db.put(7, "countries", country("Testland"), geometry);
    db.put(8, "provinces", country("Other"), polygonGeometry({rectRing(1, 1, 2, 2)}));

    EXPECT_EQ(db.lookupLocation(7).country, "Testland");
    EXPECT_EQ(db.lookupLocation(8).country, "Other");

    const Geometry *found = nullptr;
    ASSERT_EQ(db.lookupGeometry(7, "countries", &found), C_OK);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->type, GEOMETRY_TYPE_POLYGON);
    ASSERT_EQ(found->polygons.size(), 1u);
    EXPECT_EQ(found->polygons[0][0], geometry.polygons[0][0]);

    found = nullptr;
    EXPECT_EQ(db.lookupGeometry(7, "provinces", &found), C_ERR);
    EXPECT_EQ(found, nullptr);
    EXPECT_EQ(db.lookupGeometry(7, "missing", &found), C_ERR);
    EXPECT_EQ(db.lookupGeometry(99, "countries", &found), C_ERR);
}

TEST_F(DbTest, UnknownHandleIsFatal) {
    EXPECT_DEATH(db.lookupLocation(42), "");
}

}  // namespace geoLocate::test
