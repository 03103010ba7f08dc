#include <iostream>
#include <string>
#include "config.hpp"
#include "logger.hpp"
#include "state.hpp"

namespace {

    void usage() {
        std::cerr << "usage: pgshift_cli <config.json> <command> [args]\n"
                  << "commands:\n"
                  << "  init\n"
                  << "  start <schema> <migration.json>\n"
                  << "  complete <schema>\n"
                  << "  rollback <schema>\n"
                  << "  read-schema <schema>\n"
                  << "  status <schema>\n";
    }

    void print(const jval& value) {
        std::cout << jhlp::stringify(value, true) << std::endl;
    }

    void print_schema(const schema::Schema& s) {
        jdoc doc;
        jval v = s.to_json(doc.GetAllocator());
        print(v);
    }

    void print_status(State& state, const Context& ctx, const std::string& schema_name) {
        jdoc doc;
        auto& a = doc.GetAllocator();
        jval out(json::kObjectType);
        jhlp::set(out, "schema", schema_name, a);

        auto active = state.active_migration(ctx, schema_name);
        if (active) {
            jval rec = active->to_json(a);
            jhlp::set(out, "active", rec, a);
        } else {
            out.AddMember("active", jval(json::kNullType), a);
        }
        auto latest = state.latest_version(ctx, schema_name);
        if (latest) jhlp::set(out, "latestVersion", *latest, a);
        else out.AddMember("latestVersion", jval(json::kNullType), a);

        jval hist(json::kArrayType);
        for (const auto& r : state.history(ctx, schema_name)) {
            jval h(json::kObjectType);
            jhlp::set(h, "id", r.id, a);
            jhlp::set(h, "name", r.migration.name, a);
            jhlp::set(h, "status", status_name(r.status), a);
            jhlp::set(h, "createdAt", r.created_at, a);
            hist.PushBack(h, a);
        }
        jhlp::set(out, "history", hist, a);
        print(out);
    }

    int run(int argc, char** argv) {
        Config config = Config::from_file(argv[1]);
        config.apply_env();
        Logger::init("pgshift", Logger::parse_level(config.log_level));

        const std::string cmd = argv[2];
        const std::string schema_name = argc > 3 ? argv[3] : "";

        State state(config.make_pool(), config.state_options());
        Context ctx;

        if (cmd == "init") {
            state.init(ctx);
            std::cout << "{\"initialized\": true}" << std::endl;
        } else if (cmd == "start" && argc > 4) {
            Migration migration = Migration::from_file(argv[4]);
            print_schema(state.start(ctx, schema_name, migration));
        } else if (cmd == "complete" && argc > 3) {
            print_schema(state.complete(ctx, schema_name));
        } else if (cmd == "rollback" && argc > 3) {
            state.rollback(ctx, schema_name);
            std::cout << "{\"rolledBack\": true}" << std::endl;
        } else if (cmd == "read-schema" && argc > 3) {
            print_schema(state.read_schema(ctx, schema_name));
        } else if (cmd == "status" && argc > 3) {
            print_status(state, ctx, schema_name);
        } else {
            usage();
            return 2;
        }
        return 0;
    }

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        usage();
        return 2;
    }
    try {
        return run(argc, argv);
    } catch (const AlreadyActiveError& e) {
        LOG_ERROR("{}", e.what());
        return 3;
    } catch (const StateError& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    }
}
