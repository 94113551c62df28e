#include "config_parser.hpp"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace homecalc {

namespace {

// Copy obj[key] into out if present, converting type errors into ConfigParseError
template <typename T>
void read_field(const json& obj, const std::string& section, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        const std::string name = section.empty() ? key : section + "." + key;
        throw ConfigParseError("Invalid value for '" + name + "': " + e.what());
    }
}

// Returns the nested object for a section, or nullptr when the section is absent
const json* find_section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigParseError(std::string("Section '") + name + "' must be a JSON object");
    }
    return &(*it);
}

void read_loan_terms(const json& section, const std::string& name, LoanTerms& terms) {
    read_field(section, name, "amount", terms.amount);
    read_field(section, name, "interest_rate", terms.interest_rate);
    read_field(section, name, "term_years", terms.term_years);
}

} // anonymous namespace

SimulationParams params_from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigParseError("Parameter document must be a JSON object");
    }

    SimulationParams p;

    // General
    read_field(j, "", "years", p.years);
    read_field(j, "", "investment_return_rate", p.investment_return_rate);
    read_field(j, "", "inflation_rate", p.inflation_rate);
    read_field(j, "", "capital_gains_tax_rate", p.capital_gains_tax_rate);
    read_field(j, "", "pmi_monthly", p.pmi_monthly);

    if (const json* budget = find_section(j, "budget")) {
        std::string strategy = to_string(p.budget_strategy);
        read_field(*budget, "budget", "strategy", strategy);
        try {
            p.budget_strategy = parse_budget_strategy(strategy);
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError(e.what());
        }
        read_field(*budget, "budget", "monthly_salary", p.monthly_salary);
        read_field(*budget, "budget", "salary_growth_rate", p.salary_growth_rate);
        read_field(*budget, "budget", "housing_budget_percent", p.housing_budget_percent);
        read_field(*budget, "budget", "housing_budget_percent_annual_increase",
                   p.housing_budget_percent_annual_increase);
        read_field(*budget, "budget", "pay_down_mortgage_early", p.pay_down_mortgage_early);
    }

    if (const json* home = find_section(j, "home")) {
        read_field(*home, "home", "price", p.home_price);
        read_field(*home, "home", "down_payment_percent", p.down_payment_percent);
        read_field(*home, "home", "closing_costs_percent", p.closing_costs_percent);
        read_field(*home, "home", "selling_costs_percent", p.selling_costs_percent);
        read_field(*home, "home", "appreciation_rate", p.home_appreciation_rate);
        read_field(*home, "home", "property_tax_rate", p.property_tax_rate);
        read_field(*home, "home", "insurance_yearly", p.home_insurance_yearly);
        read_field(*home, "home", "maintenance_cost_percent", p.maintenance_cost_percent);
        read_field(*home, "home", "marginal_tax_rate", p.marginal_tax_rate);
    }

    if (const json* rent_out = find_section(j, "rent_out")) {
        read_field(*rent_out, "rent_out", "enabled", p.rent_out_part);
        read_field(*rent_out, "rent_out", "monthly_income", p.rent_out_income);
    }

    if (const json* m1 = find_section(j, "mortgage1")) {
        read_loan_terms(*m1, "mortgage1", p.mortgage1);
    }

    if (const json* m2 = find_section(j, "mortgage2")) {
        read_field(*m2, "mortgage2", "enabled", p.use_mortgage2);
        read_loan_terms(*m2, "mortgage2", p.mortgage2);
    }

    if (const json* sub = find_section(j, "subsidized_loan")) {
        read_field(*sub, "subsidized_loan", "enabled", p.use_subsidized_loan);
        read_field(*sub, "subsidized_loan", "amount", p.subsidized_loan_amount);
        read_field(*sub, "subsidized_loan", "term_years", p.subsidized_loan_term_years);
    }

    if (const json* rent = find_section(j, "rent")) {
        read_field(*rent, "rent", "monthly_rent", p.monthly_rent);
        read_field(*rent, "rent", "insurance_monthly", p.rent_insurance_monthly);
    }

    return p;
}

SimulationParams parse_params_from_string(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }

    SimulationParams params = params_from_json(j);

    std::vector<std::string> errors = validate_params(params);
    if (!errors.empty()) {
        throw ParamsValidationError(errors);
    }
    return params;
}

SimulationParams parse_params_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open parameter file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_params_from_string(buffer.str());
}

nlohmann::ordered_json params_to_json(const SimulationParams& p) {
    nlohmann::ordered_json j;
    j["years"] = p.years;
    j["investment_return_rate"] = p.investment_return_rate;
    j["inflation_rate"] = p.inflation_rate;
    j["capital_gains_tax_rate"] = p.capital_gains_tax_rate;

    j["budget"] = {
        {"strategy", to_string(p.budget_strategy)},
        {"monthly_salary", p.monthly_salary},
        {"salary_growth_rate", p.salary_growth_rate},
        {"housing_budget_percent", p.housing_budget_percent},
        {"housing_budget_percent_annual_increase", p.housing_budget_percent_annual_increase},
        {"pay_down_mortgage_early", p.pay_down_mortgage_early},
    };

    j["home"] = {
        {"price", p.home_price},
        {"down_payment_percent", p.down_payment_percent},
        {"closing_costs_percent", p.closing_costs_percent},
        {"selling_costs_percent", p.selling_costs_percent},
        {"appreciation_rate", p.home_appreciation_rate},
        {"property_tax_rate", p.property_tax_rate},
        {"insurance_yearly", p.home_insurance_yearly},
        {"maintenance_cost_percent", p.maintenance_cost_percent},
        {"marginal_tax_rate", p.marginal_tax_rate},
    };

    j["rent_out"] = {
        {"enabled", p.rent_out_part},
        {"monthly_income", p.rent_out_income},
    };

    j["mortgage1"] = {
        {"amount", p.mortgage1.amount},
        {"interest_rate", p.mortgage1.interest_rate},
        {"term_years", p.mortgage1.term_years},
    };

    j["mortgage2"] = {
        {"enabled", p.use_mortgage2},
        {"amount", p.mortgage2.amount},
        {"interest_rate", p.mortgage2.interest_rate},
        {"term_years", p.mortgage2.term_years},
    };

    j["pmi_monthly"] = p.pmi_monthly;

    j["subsidized_loan"] = {
        {"enabled", p.use_subsidized_loan},
        {"amount", p.subsidized_loan_amount},
        {"term_years", p.subsidized_loan_term_years},
    };

    j["rent"] = {
        {"monthly_rent", p.monthly_rent},
        {"insurance_monthly", p.rent_insurance_monthly},
    };

    return j;
}

} // namespace homecalc
