#include "site_planner/cells.hpp"

#include <cmath>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "site_planner/geometry.hpp"

namespace site_planner
{
namespace
{

using json = nlohmann::json;

class RecordDefect : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

std::optional<double> number_field(const json &object, std::initializer_list<const char *> keys)
{
    for (const char *key : keys)
    {
        const auto it = object.find(key);
        if (it == object.end() || it->is_null())
        {
            continue;
        }
        if (!it->is_number())
        {
            throw RecordDefect(std::string("field '") + key + "' is not numeric");
        }
        return it->get<double>();
    }
    return std::nullopt;
}

std::string id_field(const json &object)
{
    for (const char *key : {"id", "geoid", "cell_id", "_id"})
    {
        const auto it = object.find(key);
        if (it == object.end() || it->is_null())
        {
            continue;
        }
        if (it->is_string())
        {
            return it->get<std::string>();
        }
        if (it->is_number_integer())
        {
            return std::to_string(it->get<long long>());
        }
    }
    return {};
}

// Mean of the outer ring's vertices, or the point itself.
bool centroid_from_geometry(const json &geometry, double &lat, double &lon)
{
    if (!geometry.is_object() || !geometry.contains("coordinates"))
    {
        return false;
    }

    const auto &coordinates = geometry["coordinates"];
    const std::string type = geometry.value("type", "");

    const json *ring = nullptr;
    if (type == "Point")
    {
        if (coordinates.size() < 2 || !coordinates[0].is_number() || !coordinates[1].is_number())
        {
            return false;
        }
        lon = coordinates[0].get<double>();
        lat = coordinates[1].get<double>();
        return true;
    }
    if (type == "MultiPolygon")
    {
        if (coordinates.empty() || coordinates[0].empty())
        {
            return false;
        }
        ring = &coordinates[0][0];
    }
    else
    {
        if (coordinates.empty())
        {
            return false;
        }
        ring = &coordinates[0];
    }

    double lat_sum = 0.0;
    double lon_sum = 0.0;
    std::size_t count = 0;

    for (const auto &vertex : *ring)
    {
        if (!vertex.is_array() || vertex.size() < 2 || !vertex[0].is_number() || !vertex[1].is_number())
        {
            return false;
        }
        lon_sum += vertex[0].get<double>();
        lat_sum += vertex[1].get<double>();
        count++;
    }

    if (count == 0)
    {
        return false;
    }

    lat = lat_sum / count;
    lon = lon_sum / count;
    return true;
}

} // namespace

std::optional<Cell> parse_cell(const json &record)
{
    if (!record.is_object())
    {
        return std::nullopt;
    }

    const json &props = (record.contains("properties") && record["properties"].is_object())
                            ? record["properties"]
                            : record;

    try
    {
        Cell cell;
        cell.id = id_field(props);
        if (cell.id.empty())
        {
            cell.id = id_field(record);
        }
        if (cell.id.empty())
        {
            throw RecordDefect("missing cell id");
        }

        const auto lat = number_field(props, {"lat", "centroidLat", "centroid_lat"});
        const auto lon = number_field(props, {"lon", "centroidLon", "centroid_lon"});
        if (lat && lon)
        {
            cell.lat = *lat;
            cell.lon = *lon;
        }
        else if (!record.contains("geometry") || !centroid_from_geometry(record["geometry"], cell.lat, cell.lon))
        {
            throw RecordDefect("missing centroid");
        }

        if (!is_valid_coordinate(cell.lat, cell.lon))
        {
            throw RecordDefect("malformed centroid");
        }

        const double population = number_field(props, {"population", "pop"}).value_or(0.0);
        if (!std::isfinite(population) || population < 0.0)
        {
            throw RecordDefect("negative population");
        }
        cell.population = std::lround(population);

        cell.risk_score = number_field(props, {"riskScore", "risk_score", "food_insecurity_score", "foodInsecurityScore"})
                              .value_or(0.0);
        cell.poverty_rate = number_field(props, {"povertyRate", "poverty_rate"}).value_or(0.0);
        cell.benefit_rate = number_field(props, {"benefitRate", "benefit_rate", "snap_rate", "snapRate"}).value_or(0.0);
        cell.vehicle_access_rate = number_field(props, {"vehicleAccessRate", "vehicle_access_rate"}).value_or(1.0);

        // Fallback only; an independently supplied need always wins.
        const auto need = number_field(props, {"needIndex", "need_index", "need"});
        cell.need_index = need ? *need : cell.population * cell.risk_score;

        return cell;
    }
    catch (const RecordDefect &ex)
    {
        std::cerr << "Skipping cell record: " << ex.what() << std::endl;
    }
    catch (const json::exception &ex)
    {
        std::cerr << "Skipping cell record: " << ex.what() << std::endl;
    }

    return std::nullopt;
}

CellDataset parse_cells(const json &records)
{
    CellDataset dataset;

    const json *list = &records;
    if (records.is_object())
    {
        if (records.contains("features"))
        {
            list = &records["features"];
        }
        else if (records.contains("cells"))
        {
            list = &records["cells"];
        }
    }

    if (!list->is_array())
    {
        std::cerr << "Cell payload is not an array." << std::endl;
        return dataset;
    }

    dataset.cells.reserve(list->size());

    for (const auto &record : *list)
    {
        auto cell = parse_cell(record);
        if (!cell)
        {
            dataset.skipped_records++;
            continue;
        }

        if (cell->population <= 0)
        {
            dataset.unpopulated_cells++;
            continue;
        }

        dataset.cells.push_back(std::move(*cell));
    }

    std::cout << "Parsed " << dataset.cells.size() << " populated cells ("
              << dataset.unpopulated_cells << " unpopulated, "
              << dataset.skipped_records << " skipped)." << std::endl;

    return dataset;
}

DomainStatistics compute_statistics(const std::vector<Cell> &cells, double high_need_threshold)
{
    DomainStatistics statistics;
    double risk_sum = 0.0;

    for (const auto &cell : cells)
    {
        if (cell.population <= 0)
        {
            continue;
        }

        statistics.total_cells++;
        statistics.total_population += cell.population;
        statistics.total_need += cell.need_index;
        risk_sum += cell.risk_score;

        if (cell.risk_score > high_need_threshold)
        {
            statistics.high_need_cells++;
        }
    }

    statistics.average_risk_score = statistics.total_cells > 0 ? risk_sum / statistics.total_cells : 0.0;
    return statistics;
}

} // namespace site_planner
