#include "parquet_writer.hpp"
#include <stdexcept>
#include <utility>
#include <vector>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace homecalc {

#ifdef HAVE_ARROW

namespace {

// Named float64 column
using DoubleColumn = std::pair<std::string, std::vector<double>>;

void check_status(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> build_int_column(const std::vector<int32_t>& values,
                                               const std::string& name) {
    arrow::Int32Builder builder;
    check_status(builder.Reserve(static_cast<int64_t>(values.size())), "reserve " + name + " column");
    check_status(builder.AppendValues(values), "append " + name);

    std::shared_ptr<arrow::Array> array;
    check_status(builder.Finish(&array), "finish " + name + " array");
    return array;
}

std::shared_ptr<arrow::Array> build_double_column(const DoubleColumn& column) {
    arrow::DoubleBuilder builder;
    check_status(builder.Reserve(static_cast<int64_t>(column.second.size())),
                 "reserve " + column.first + " column");
    check_status(builder.AppendValues(column.second), "append " + column.first);

    std::shared_ptr<arrow::Array> array;
    check_status(builder.Finish(&array), "finish " + column.first + " array");
    return array;
}

void write_table(const std::string& key_name,
                 const std::vector<int32_t>& keys,
                 const std::vector<DoubleColumn>& columns,
                 const std::string& filepath) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    fields.push_back(arrow::field(key_name, arrow::int32()));
    arrays.push_back(build_int_column(keys, key_name));

    for (const auto& column : columns) {
        fields.push_back(arrow::field(column.first, arrow::float64()));
        arrays.push_back(build_double_column(column));
    }

    auto table = arrow::Table::Make(arrow::schema(fields), arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check_status(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
                 "write Parquet table");
    check_status(outfile->Close(), "close Parquet file");
}

} // anonymous namespace

void ParquetWriter::write_yearly(const SimulationResult& result, const std::string& filepath) {
    if (result.yearly.empty()) {
        throw std::runtime_error("SimulationResult has no yearly records to write.");
    }

    const size_t n = result.yearly.size();
    std::vector<int32_t> years;
    years.reserve(n);

    std::vector<DoubleColumn> columns = {
        {"home_value", {}}, {"mortgage_balance", {}}, {"equity", {}},
        {"buy_cash_flow", {}}, {"buy_portfolio", {}}, {"buy_net_worth", {}},
        {"yearly_interest_paid", {}}, {"yearly_principal_paid", {}},
        {"rent_cost", {}}, {"yearly_rent_paid", {}},
        {"rent_portfolio", {}}, {"rent_net_worth", {}},
    };
    for (auto& column : columns) {
        column.second.reserve(n);
    }

    for (const auto& y : result.yearly) {
        years.push_back(static_cast<int32_t>(y.year));
        columns[0].second.push_back(y.home_value);
        columns[1].second.push_back(y.mortgage_balance);
        columns[2].second.push_back(y.equity);
        columns[3].second.push_back(y.buy_cash_flow);
        columns[4].second.push_back(y.buy_portfolio);
        columns[5].second.push_back(y.buy_net_worth);
        columns[6].second.push_back(y.yearly_interest_paid);
        columns[7].second.push_back(y.yearly_principal_paid);
        columns[8].second.push_back(y.rent_cost);
        columns[9].second.push_back(y.yearly_rent_paid);
        columns[10].second.push_back(y.rent_portfolio);
        columns[11].second.push_back(y.rent_net_worth);
    }

    write_table("year", years, columns, filepath);
}

void ParquetWriter::write_monthly(const SimulationResult& result, const std::string& filepath) {
    if (result.monthly.empty()) {
        throw std::runtime_error("SimulationResult has no monthly records to write.");
    }

    const size_t n = result.monthly.size();
    std::vector<int32_t> months;
    months.reserve(n);

    std::vector<DoubleColumn> columns = {
        {"interest_paid", {}}, {"principal_paid", {}}, {"balance", {}},
        {"primary_balance", {}}, {"secondary_balance", {}}, {"subsidized_balance", {}},
        {"net_buy_cost", {}}, {"rent_cost", {}}, {"budget", {}},
        {"extra_principal_secondary", {}}, {"extra_principal_primary", {}},
        {"buy_contribution", {}}, {"rent_contribution", {}},
    };
    for (auto& column : columns) {
        column.second.reserve(n);
    }

    for (const auto& m : result.monthly) {
        months.push_back(static_cast<int32_t>(m.month));
        columns[0].second.push_back(m.interest_paid);
        columns[1].second.push_back(m.principal_paid);
        columns[2].second.push_back(m.balance);
        columns[3].second.push_back(m.primary_balance);
        columns[4].second.push_back(m.secondary_balance);
        columns[5].second.push_back(m.subsidized_balance);
        columns[6].second.push_back(m.net_buy_cost);
        columns[7].second.push_back(m.rent_cost);
        columns[8].second.push_back(m.budget);
        columns[9].second.push_back(m.extra_principal_secondary);
        columns[10].second.push_back(m.extra_principal_primary);
        columns[11].second.push_back(m.buy_contribution);
        columns[12].second.push_back(m.rent_contribution);
    }

    write_table("month", months, columns, filepath);
}

#else // !HAVE_ARROW

void ParquetWriter::write_yearly(const SimulationResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHOMECALC_WITH_ARROW=ON to enable Parquet support.");
}

void ParquetWriter::write_monthly(const SimulationResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHOMECALC_WITH_ARROW=ON to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace homecalc
