#include "devmem/config/system_config.hpp"
#include "devmem/embedding/embedding_provider.hpp"
#include "devmem/extraction/entity_extractor.hpp"
#include "devmem/graph/knowledge_graph.hpp"
#include "devmem/memory/memory_store.hpp"
#include "devmem/events/event_processor.hpp"
#include <iostream>
#include <iomanip>

using namespace devmem;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

MemoryEvent make_event(
    const std::string& id,
    MemoryEventType type,
    EventPriority priority,
    nlohmann::json data,
    double confidence = 0.7
) {
    MemoryEvent event;
    event.id = id;
    event.type = type;
    event.timestamp = std::chrono::system_clock::now();
    event.user_id = "developer";
    event.session_id = "example-session";
    event.data = std::move(data);
    event.metadata.confidence = confidence;
    event.metadata.source = EventSource::UserInput;
    event.metadata.priority = priority;
    event.metadata.tags = {"example"};
    return event;
}

int main(int argc, char* argv[]) {
    print_separator("Event-Driven Knowledge Graph Pipeline");

    // =========================================================================
    // Configuration
    // =========================================================================

    std::string config_path = argc > 1 ? argv[1] : "";
    SystemConfig config;
    try {
        config = load_config_with_fallback(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << "\n";
        return 1;
    }

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }

    std::cout << "Configuration:\n" << config.to_json().dump(2) << "\n";

    // =========================================================================
    // Wiring
    // =========================================================================

    auto embeddings = EmbeddingProviderFactory::create(config.embedding);
    auto extractor = std::make_shared<EntityExtractor>(embeddings);
    auto graph = std::make_shared<KnowledgeGraph>(embeddings);
    auto store = std::make_shared<InMemoryMemoryStore>();
    EventProcessor processor(graph, extractor, store, config.processor);

    graph->add_update_listener([](const GraphUpdateSummary& summary) {
        std::cout << "[graph] +" << summary.nodes_added << " nodes, +"
                  << summary.edges_added << " edges (total "
                  << summary.total_nodes << "/" << summary.total_edges << ")\n";
    });

    ProcessorObserver observer;
    observer.on_event_processed = [](const MemoryEvent& event, const ProcessingResult& result) {
        std::cout << "[processed] " << event.id << " -> "
                  << result.memory_updates.size() << " memory updates\n";
    };
    observer.on_critical_processed = [](const MemoryEvent& event, const ProcessingResult&) {
        std::cout << "[critical] " << event.id << " handled immediately\n";
    };
    observer.on_learning_trigger = [](const LearningTrigger& trigger) {
        std::cout << "[learning] " << to_string(trigger.type) << " / "
                  << to_string(trigger.action) << "\n";
    };
    observer.on_event_dropped = [](const MemoryEvent& event, const std::string& message) {
        std::cout << "[dropped] " << event.id << ": " << message << "\n";
    };
    processor.subscribe(observer);

    EventStreamOptions stream_options;
    stream_options.filter = [](const MemoryEvent& event) {
        return event.type == MemoryEventType::CodeGeneration;
    };
    stream_options.buffer_size = 2;
    auto stream = processor.create_event_stream(stream_options);
    stream->on_batch([](const std::vector<MemoryEvent>& batch) {
        std::cout << "[stream] batch of " << batch.size() << " code events\n";
    });

    // =========================================================================
    // Events
    // =========================================================================

    print_separator("Submitting Events");

    try {
        processor.submit_event(make_event("evt-1", MemoryEventType::CodeGeneration, EventPriority::Medium,
            "class UserService extends BaseService {}\n"
            "function fetchUser(id) { return db.find(id); }\n"
            "import { Database } from './database'"));

        processor.submit_event(make_event("evt-2", MemoryEventType::CodeGeneration, EventPriority::High,
            {{"code", "def load_orders(user):\n    pass\nclass OrderRepository(BaseRepository):\n    pass\n"},
             {"language", "python"}}));

        processor.submit_event(make_event("evt-3", MemoryEventType::BugFix, EventPriority::Critical,
            {{"bug", "null user in fetchUser"}, {"fix", "guard against missing id"}}, 0.95));

        processor.submit_event(make_event("evt-4", MemoryEventType::TeamInteraction, EventPriority::Low,
            {{"reviewer", "alice"}, {"comment", "prefer early returns"}}));

        processor.submit_event(make_event("evt-5", MemoryEventType::ModeChange, EventPriority::Medium,
            {{"mode", "debugging"}}));

        processor.submit_event(make_event("evt-6", MemoryEventType::LearningUpdate, EventPriority::Medium,
            "const retryRequest = async (request) => {}"));
    } catch (const InvalidEventError& e) {
        std::cerr << "Rejected event: " << e.what() << "\n";
        return 1;
    }

    stream->flush();

    while (processor.queue_size() > 0) {
        processor.process_pending_batch();
    }

    // =========================================================================
    // Results
    // =========================================================================

    print_separator("Statistics");
    std::cout << processor.get_statistics().to_json().dump(2) << "\n";
    std::cout << graph->get_statistics().to_json().dump(2) << "\n";

    print_separator("Search: \"fetch user\"");
    SearchOptions search;
    search.query = "fetchUser";
    search.min_similarity = 0.3;
    search.top_k = 5;
    for (const auto& result : graph->search(search)) {
        std::cout << std::fixed << std::setprecision(3) << result.similarity
                  << "  " << result.node.type << "  " << result.node.name << "\n";
    }

    print_separator("Class Hierarchy Path");
    std::string child_id;
    std::string parent_id;
    for (const auto& node : graph->export_for_visualization().nodes) {
        if (node.label == "UserService") child_id = node.id;
        if (node.label == "BaseService") parent_id = node.id;
    }
    auto path = graph->find_path(child_id, parent_id);
    if (path) {
        for (size_t i = 0; i < path->size(); ++i) {
            std::cout << (i ? " -> " : "") << (*path)[i].name;
        }
        std::cout << "\n";
    } else {
        std::cout << "No path found\n";
    }

    print_separator("Memory Store");
    std::cout << "bugPatterns: " << store->query(MemoryTarget::Both, "bugPatterns").dump(2) << "\n";
    std::cout << "currentMode: " << store->query(MemoryTarget::System2, "currentMode").dump() << "\n";

    try {
        graph->export_to_json("knowledge_graph.json");
        std::cout << "\nGraph written to knowledge_graph.json\n";
    } catch (const std::exception& e) {
        std::cerr << "Export failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
