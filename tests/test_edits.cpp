#include <catch2/catch_test_macros.hpp>
#include <sstream>

#include <tsim/edits.hpp>
#include <tsim/errors.hpp>

using namespace tsim;

static std::string csv_edits = R"(road,change,value
# Montlake Blvd gets a bus lane
15,add_bus_lane
 16 , add_bus_lane ,
3,set_speed_limit,30

7,close_road
2,set_lanes,2
)";

TEST_CASE("edits_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_edits);
  const MapEdits e = edits_from_csv_stream(ss, "bus_lanes");
  REQUIRE(e.name == "bus_lanes");
  REQUIRE(e.commands.size() == 5);
  REQUIRE(e.commands[0] == MapEdit{15, EditKind::AddBusLane, 0});
  REQUIRE(e.commands[1] == MapEdit{16, EditKind::AddBusLane, 0});
  REQUIRE(e.commands[2] == MapEdit{3, EditKind::SetSpeedLimit, 30});
  REQUIRE(e.commands[3] == MapEdit{7, EditKind::CloseRoad, 0});
  REQUIRE(e.commands[4] == MapEdit{2, EditKind::SetLanes, 2});
}

TEST_CASE("edits_from_csv_stream names the bad line") {
  SECTION("unknown change") {
    std::istringstream ss("road,change\n0,add_bike_lane\n1,paint_it_red\n");
    try {
      edits_from_csv_stream(ss, "bad");
      FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
      REQUIRE(std::string(e.what()).find("line 3") != std::string::npos);
    }
  }

  SECTION("missing or zero value") {
    std::istringstream a("0,set_lanes\n");
    REQUIRE_THROWS_AS(edits_from_csv_stream(a, "bad"), ConfigError);
    std::istringstream b("0,set_speed_limit,0\n");
    REQUIRE_THROWS_AS(edits_from_csv_stream(b, "bad"), ConfigError);
  }

  SECTION("value on a flag edit") {
    std::istringstream ss("0,close_road,3\n");
    REQUIRE_THROWS_AS(edits_from_csv_stream(ss, "bad"), ConfigError);
  }

  SECTION("negative road") {
    std::istringstream ss("-1,close_road\n");
    REQUIRE_THROWS_AS(edits_from_csv_stream(ss, "bad"), ConfigError);
  }
}

TEST_CASE("write_edits_csv output reads back") {
  const MapEdits e{"mine", {{4, EditKind::AddBikeLane, 0}, {9, EditKind::SetLanes, 4}}};
  std::stringstream ss;
  write_edits_csv(ss, e);
  REQUIRE(edits_from_csv_stream(ss, "mine") == e);
}

TEST_CASE("edit kind names") {
  REQUIRE(std::string(to_string(EditKind::AddBikeLane)) == "add_bike_lane");
  REQUIRE(edit_kind_from_string("set_speed_limit") == EditKind::SetSpeedLimit);
  REQUIRE_FALSE(edit_kind_from_string("Add_Bike_Lane").has_value());
}

TEST_CASE("load_edits_csv returns nullopt on missing file") {
  REQUIRE_FALSE(load_edits_csv("this_file_does_not_exist.csv").has_value());
}
