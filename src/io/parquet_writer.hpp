#ifndef HOMECALC_PARQUET_WRITER_HPP
#define HOMECALC_PARQUET_WRITER_HPP

#include "../simulation.hpp"
#include <string>

namespace homecalc {

class ParquetWriter {
public:
    /**
     * Write the yearly series to a Parquet file.
     *
     * Output schema:
     *   - year: int32 (1-based)
     *   - one float64 column per YearlyRecord field, same names
     *     (home_value, mortgage_balance, equity, ..., rent_net_worth)
     *
     * @throws std::runtime_error if the series is empty, the file cannot be
     *         written, or the build has no Arrow support
     */
    static void write_yearly(const SimulationResult& result, const std::string& filepath);

    /**
     * Write the monthly series to a Parquet file.
     *
     * Output schema:
     *   - month: int32 (1-based)
     *   - one float64 column per MonthlyRecord field, same names
     *
     * @throws std::runtime_error as for write_yearly
     */
    static void write_monthly(const SimulationResult& result, const std::string& filepath);
};

} // namespace homecalc

#endif // HOMECALC_PARQUET_WRITER_HPP
