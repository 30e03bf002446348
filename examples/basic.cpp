#include <oryx/oryx.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <variant>

auto main() -> int {
    const auto dir = std::filesystem::temp_directory_path() / "oryx_example";
    std::filesystem::create_directories(dir);
    const auto staff_path = dir / "staff.csv";
    const auto depts_path = dir / "departments.csv";
    {
        std::ofstream staff(staff_path);
        staff << "Employee,Department,Salary\nA,X,100\nB,X,900\nC,Y,50\nD,Z,300\n";
        std::ofstream depts(depts_path);
        depts << "Department,Floor\nX,1\nY,2\n";
    }

    fmt::print("=== Grouped aggregate ===\n");
    auto staff = oryx::DataFrame::from_csv(staff_path);
    staff.set_type("int", "Salary")
        .filter({"Salary"},
                [](std::span<const oryx::Value> v) { return std::get<std::int64_t>(v[0]) <= 800; })
        .group_by({"Department"})
        .aggregate(oryx::agg::mean(), {"Salary"}, {"dept_avg"});
    fmt::print("{}", oryx::runtime::render_preview(staff.preview()));

    auto report = staff.compute({.output_path = dir / "dept_avg.csv"});
    fmt::print("wrote {} row(s) to {}\n", report.rows_written, (dir / "dept_avg.csv").string());

    fmt::print("\n=== Left join ===\n");
    auto people = oryx::DataFrame::from_csv(staff_path);
    auto depts = oryx::DataFrame::from_csv(depts_path);
    auto joined = oryx::left_join(people, depts, {"Department"}, {"Department"});
    fmt::print("{}", oryx::runtime::render_preview(joined.preview()));

    fmt::print("\n=== External sort ===\n");
    people.set_type("int", "Salary");
    auto sorted = people.sort({"-", "Salary"}, dir / "by_salary.csv");
    fmt::print("sorted {} row(s)\n", sorted);
    return 0;
}
