// =================================================================
// tests/ParameterValidatorTest.cpp
// =================================================================
// Unit tests for ParameterValidator and ValidationFailureCounter.

#include "Ramify/ParameterValidator.hpp"
#include "Ramify/ParameterSpec.hpp"
#include "Ramify/Errors.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace Ramify;

class ParameterValidatorTest {
private:
    std::vector<ParameterSpec> createSchema() {
        return {
            ParameterSpec::make("topic", ParameterType::STRING, "What to research"),
            ParameterSpec::make("count", ParameterType::INTEGER, "How many results"),
            ParameterSpec::make("verbose", ParameterType::BOOL, "", false),
            ParameterSpec::make("tags", ParameterType::ARRAY, "", false)
        };
    }

public:
    void testValidArguments() {
        std::cout << "Testing valid arguments..." << std::endl;

        ArgumentMap args;
        args["topic"] = "compilers";
        args["count"] = 3;
        args["verbose"] = true;

        ValidationReport report = ParameterValidator::validate(createSchema(), args);
        assert(report.isValid() && "Complete arguments should validate");
        assert(report.describe().empty() && "A valid report has no description");

        std::cout << "✓ Valid arguments test passed" << std::endl;
    }

    void testMissingRequired() {
        std::cout << "Testing missing required parameters..." << std::endl;

        ArgumentMap args;
        args["verbose"] = false;

        ValidationReport report = ParameterValidator::validate(createSchema(), args);
        assert(!report.isValid());
        assert(report.missing_required.size() == 2);
        assert(report.missing_required[0] == "topic");
        assert(report.missing_required[1] == "count");
        assert(report.describe() == "Missing required parameters: topic, count");

        std::string missing = ParameterValidator::describeMissing(createSchema(), args);
        assert(missing == "'topic' (What to research), 'count' (How many results)");

        std::cout << "✓ Missing required test passed" << std::endl;
    }

    void testExplicitNullIsPresent() {
        std::cout << "Testing explicit null values..." << std::endl;

        ArgumentMap args;
        args["topic"] = nullptr;
        args["count"] = nullptr;

        ValidationReport report = ParameterValidator::validate(createSchema(), args);
        assert(report.isValid() && "Null values count as present and are never type errors");

        std::cout << "✓ Explicit null test passed" << std::endl;
    }

    void testTypeErrors() {
        std::cout << "Testing type errors..." << std::endl;

        ArgumentMap args;
        args["topic"] = "compilers";
        args["count"] = nlohmann::json::object();
        args["tags"] = "not-a-list";

        ValidationReport report = ParameterValidator::validate(createSchema(), args);
        assert(!report.isValid());
        assert(report.missing_required.empty());
        assert(report.type_errors.size() == 2);
        assert(report.type_errors[0] == "Parameter 'count' expected type Integer but got object");
        assert(report.type_errors[1] == "Parameter 'tags' expected type Array but got string");

        std::string description = report.describe();
        assert(description.find("Type validation errors: ") == 0);
        assert(description.find("; ") != std::string::npos);

        std::cout << "✓ Type errors test passed" << std::endl;
    }

    void testCombinedDescription() {
        std::cout << "Testing combined description..." << std::endl;

        ArgumentMap args;
        args["count"] = nlohmann::json::array();

        ValidationReport report = ParameterValidator::validate(createSchema(), args);
        std::string description = report.describe();
        assert(description.find("Missing required parameters: topic") == 0);
        assert(description.find(" AND Type validation errors: ") != std::string::npos);

        std::cout << "✓ Combined description test passed" << std::endl;
    }

    void testCompatibilityRules() {
        std::cout << "Testing compatibility rules..." << std::endl;

        // Strings accept anything, including host objects
        assert(ParameterValidator::isCompatible(Value(42), ParameterType::STRING));
        assert(ParameterValidator::isCompatible(Value::opaque("Widget"), ParameterType::STRING));

        // Numeric and boolean parameters accept strings for conversion
        assert(ParameterValidator::isCompatible(Value("7"), ParameterType::INTEGER));
        assert(ParameterValidator::isCompatible(Value(2.5), ParameterType::NUMBER));
        assert(ParameterValidator::isCompatible(Value("true"), ParameterType::BOOL));
        assert(!ParameterValidator::isCompatible(Value(true), ParameterType::INTEGER));

        assert(ParameterValidator::isCompatible(Value("2024-01-01T00:00:00Z"), ParameterType::DATETIME));
        assert(!ParameterValidator::isCompatible(Value(12), ParameterType::DATETIME));

        assert(ParameterValidator::isCompatible(Value(nlohmann::json::object()), ParameterType::OBJECT));
        assert(!ParameterValidator::isCompatible(Value(nlohmann::json::array()), ParameterType::OBJECT));

        // Host objects are only strings
        assert(!ParameterValidator::isCompatible(Value::callable("Callback"), ParameterType::OBJECT));

        std::cout << "✓ Compatibility rules test passed" << std::endl;
    }

    void testFailureCounterThreshold() {
        std::cout << "Testing failure counter threshold..." << std::endl;

        ValidationReport missing;
        missing.missing_required.push_back("success");

        ValidationFailureCounter counter;
        for (int i = 1; i < ValidationFailureCounter::MAX_FAILURES; ++i) {
            assert(!counter.recordFailure(missing) && "Below the threshold nothing escalates");
        }
        assert(counter.recordFailure(missing) && "The fifth failure escalates");
        assert(counter.getMissingRequiredCount() == ValidationFailureCounter::MAX_FAILURES);
        assert(counter.getTypeErrorCount() == 0);

        std::cout << "✓ Failure counter threshold test passed" << std::endl;
    }

    void testFailureCountersAreSeparate() {
        std::cout << "Testing separate failure counters..." << std::endl;

        ValidationReport missing;
        missing.missing_required.push_back("success");
        ValidationReport wrong_type;
        wrong_type.type_errors.push_back("Parameter 'success' expected type Boolean but got object");

        ValidationFailureCounter counter;
        for (int i = 0; i < 4; ++i) {
            assert(!counter.recordFailure(missing));
            assert(!counter.recordFailure(wrong_type));
        }
        assert(counter.getMissingRequiredCount() == 4);
        assert(counter.getTypeErrorCount() == 4);

        assert(counter.recordFailure(wrong_type));

        std::cout << "✓ Separate failure counters test passed" << std::endl;
    }

    void testSchemaRendering() {
        std::cout << "Testing schema rendering..." << std::endl;

        ParameterSpec item = ParameterSpec::make("item", ParameterType::STRING);
        ParameterSpec list = ParameterSpec::make("items", ParameterType::ARRAY, "Things to process");
        list.element = std::make_shared<const ParameterSpec>(item);

        ParameterSpec when = ParameterSpec::make("when", ParameterType::DATETIME, "", false);

        ToolSchema schema;
        schema.name = "process";
        schema.description = "Process items";
        schema.parameters = {list, when};

        nlohmann::json parameters = schema.parametersSchema();
        assert(parameters["type"] == "object");
        assert(parameters["properties"]["items"]["type"] == "array");
        assert(parameters["properties"]["items"]["items"]["type"] == "string");
        assert(parameters["properties"]["when"]["format"] == "date-time");
        assert(parameters["required"].size() == 1);
        assert(parameters["required"][0] == "items");

        nlohmann::json tool = schema.toJson();
        assert(tool["name"] == "process");
        assert(tool["description"] == "Process items");

        std::cout << "✓ Schema rendering test passed" << std::endl;
    }

    void testParameterTypeNames() {
        std::cout << "Testing parameter type names..." << std::endl;

        assert(parameterTypeFromString("Integer") == ParameterType::INTEGER);
        assert(parameterTypeFromString("boolean") == ParameterType::BOOL);
        assert(parameterTypeFromString(parameterTypeToString(ParameterType::DATETIME)) == ParameterType::DATETIME);

        bool threw = false;
        try {
            parameterTypeFromString("complex");
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Unknown type names are configuration errors");

        std::cout << "✓ Parameter type names test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ParameterValidator unit tests..." << std::endl;

        testValidArguments();
        testMissingRequired();
        testExplicitNullIsPresent();
        testTypeErrors();
        testCombinedDescription();
        testCompatibilityRules();
        testFailureCounterThreshold();
        testFailureCountersAreSeparate();
        testSchemaRendering();
        testParameterTypeNames();

        std::cout << "All ParameterValidator tests passed!" << std::endl;
    }
};

int main() {
    try {
        ParameterValidatorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ParameterValidator component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
