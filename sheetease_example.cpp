#include "include/sheetease.hpp"
#include <iostream>

using namespace sheetease;

namespace
{
    cell_value n(double d) { return cell_value{d}; }
    cell_value t(std::string s) { return cell_value{std::move(s)}; }
    cell_value none() { return cell_value{}; }

    // Customers: plain integer keys.
    sheet customers_sheet()
    {
        return sheet{
            "Customers",
            {
                { t("key"), t("display name"), t("home position"), t("tags")         },
                { t("Id"),  t("Name"),         t("Home"),          t("Tags")         },
                { t("int"), t("string"),       t("Math.Vector3"),  t("list(string)") },
                { none(),   t("required"),     none(),             none()            },
                { t("id"),  t("name"),         t("home"),          t("tags")         },
                { none(),   none(),            t("0,0,0"),         none()            },
                { n(1),     t("Ada"),          t("1,2,3"),         t("vip, early")   },
                { n(2),     t("Brian"),        none(),             none()            },
                { n(3),     t("Chen"),         t("4,5,x"),         t("new")          },
            }
        };
    }

    // Orders: composite key (customer, serial) and a reference to Customers.
    sheet orders_sheet()
    {
        return sheet{
            "Orders",
            {
                { t("order"), t("customer"),      t("serial"),      t("who"),               t("lines"),             t("note")   },
                { t("Order"), t("Customer"),      t("Serial"),      t("Buyer"),             t("Lines"),             t("Note")   },
                { t("int"),   t("int"),           t("int"),         t("int"),               t("dict(string,int)"),  t("string") },
                { none(),     none(),             none(),           t("required"),          none(),                 t("ignore") },
                { t("id"),    t("key1:customer"), t("key2:serial"), t("[Customers]buyer"),  t("lines"),             t("note")   },
                { none(),     none(),             none(),           none(),                 none(),                 none()      },
                { n(0),       n(1),               n(1),             n(1),                   t("apple:2\npear:1"),   t("first")  },
                { n(0),       n(1),               n(2),             n(7),                   t("plum:5"),            none()      },
                { n(0),       n(3),               n(1),             n(3),                   none(),                 none()      },
            }
        };
    }
}

int main()
{
    custom_type_registry registry;
    registry.add("Math.Vector3", [](cell_value const& raw) -> value
    {
        auto parts = detail::split(detail::stringify(raw), ',');
        if (parts.size() != 3)
            throw std::invalid_argument("expected x,y,z");

        value v = value::array();
        for (auto p : parts)
        {
            auto d = detail::parse_decimal(p);
            if (!d)
                throw std::invalid_argument("'" + detail::trim(p) + "' is not a number");
            v.push_back(*d);
        }
        return v;
    });

    std::vector<workbook> books;
    books.push_back({ "<example>/Customers", { customers_sheet() } });
    books.push_back({ "<example>/Orders", { orders_sheet() } });

    export_options options;
    auto batch = export_batch(books, registry, options);

    std::cout << "=== SheetEase Example ===\n\n";

    for (auto const& table : batch.result.tables)
    {
        std::cout << "--- " << file_name(options.json_file_pattern, table.table) << " ---\n";
        std::cout << render_document(table, options) << "\n";
    }

    for (auto const& d : batch.result.descriptions)
    {
        std::cout << "--- " << file_name(options.description_file_pattern, d.name) << " ---\n";
        std::cout << render_description(d, options) << "\n";
    }

    std::cout << "--- diagnostics ---\n";
    for (auto const& e : batch.errors)
        std::cout << to_string(e) << "\n";

    auto const& refs = batch.result.references;
    std::cout << "\nreferences: " << refs.checked << " checked, " << refs.failed << " failed, "
              << refs.skipped << " skipped\n";

    return 0;
}
