#include "Inventory.hpp"
#include "ReefError.hpp"
#include <cassert>
#include <functional>
#include <iostream>
#include <string>

static bool throws_code(ErrorCode code, const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ReefError& e) {
        return e.code() == code;
    }
    return false;
}

void test_round_trip_preserves_text() {
    const std::string samples[] = {
        "",
        "\n",
        "[admin]\n# note\nmgr1 ip=10.0.0.1",
        "# leading comment\n\n[web]\nweb1 ansible_user=ubuntu  ansible_port=22\n\n\n[db]\n  db1 ip=10.0.0.5 # primary\n",
        "ungrouped1 a=1\n[web:vars]\nhttp_port = 8080\n[all:children]\nweb\n",
        "[web]\r\nweb1 x=1\r\n",
    };
    for (const auto& text : samples) {
        Inventory inv = Inventory::parse(text);
        assert(inv.render() == text);
    }
    std::cout << "test_round_trip_preserves_text passed" << std::endl;
}

void test_parse_groups_and_vars() {
    Inventory inv = Inventory::parse(
        "[security_server]\n"
        "192.168.1.100 ansible_user=admin ansible_password=pass\n"
        "\n"
        "[agents]\n"
        "10.0.0.1 ansible_user=user1\n"
        "10.0.0.2 ansible_user=user2 ansible_password=pass2 custom_flag=yes\n");

    auto groups = inv.groups();
    assert(groups.size() == 2);
    assert(groups[0] == "security_server");
    assert(groups[1] == "agents");

    const HostEntry* server = inv.find_host("security_server", "192.168.1.100");
    assert(server != nullptr);
    assert(server->get("ansible_user").value() == "admin");

    const HostEntry* agent2 = inv.find_host("agents", "10.0.0.2");
    assert(agent2 != nullptr);
    assert(agent2->vars.size() == 3);
    assert(agent2->vars[2].first == "custom_flag");
    assert(agent2->get("custom_flag").value() == "yes");

    auto hosts = inv.hosts();
    assert(hosts.size() == 3);
    assert(hosts[0].first == "security_server");
    assert(hosts[2].second.host == "10.0.0.2");
    std::cout << "test_parse_groups_and_vars passed" << std::endl;
}

void test_malformed_lines() {
    assert(throws_code(ErrorCode::MalformedInventory, [] { Inventory::parse("[web\nhost1\n"); }));
    assert(throws_code(ErrorCode::MalformedInventory, [] { Inventory::parse("[web]\nhost1 novalue\n"); }));
    assert(throws_code(ErrorCode::MalformedInventory, [] { Inventory::parse("[web]\nkey=value\n"); }));
    assert(throws_code(ErrorCode::MalformedInventory, [] { Inventory::parse("[web]\nh1\n[web]\nh2\n"); }));
    assert(throws_code(ErrorCode::MalformedInventory, [] { Inventory::parse("[web]\nh1\nh1 a=1\n"); }));
    assert(throws_code(ErrorCode::MalformedInventory, [] { Inventory::parse("[]\n"); }));
    std::cout << "test_malformed_lines passed" << std::endl;
}

void test_add_host_to_new_group() {
    const std::string original = "[admin]\n# note\nmgr1 ip=10.0.0.1";
    Inventory inv = Inventory::parse(original);
    inv.add_host("internal", "db1", {{"ip", "10.0.0.5"}});

    const std::string rendered = inv.render();
    assert(rendered.compare(0, original.size(), original) == 0);
    assert(rendered.find("[admin]") != std::string::npos);
    assert(rendered.find("# note") != std::string::npos);
    assert(rendered.find("[internal]\ndb1 ip=10.0.0.5") != std::string::npos);
    assert(rendered.find("[admin]") < rendered.find("[internal]"));
    assert(inv.find_host("internal", "db1") != nullptr);
    std::cout << "test_add_host_to_new_group passed" << std::endl;
}

void test_add_host_to_existing_group_keeps_other_lines() {
    const std::string original =
        "# fleet\n"
        "[web]\n"
        "web1 a=1\n"
        "# trailing note for web\n"
        "\n"
        "[db]\n"
        "db1 b=2 # keep me\n";
    Inventory inv = Inventory::parse(original);
    inv.add_host("web", "web2", {{"a", "2"}});

    const std::string expected =
        "# fleet\n"
        "[web]\n"
        "web1 a=1\n"
        "web2 a=2\n"
        "# trailing note for web\n"
        "\n"
        "[db]\n"
        "db1 b=2 # keep me\n";
    assert(inv.render() == expected);
    std::cout << "test_add_host_to_existing_group_keeps_other_lines passed" << std::endl;
}

void test_duplicate_and_missing_hosts() {
    Inventory inv = Inventory::parse("[web]\nweb1 a=1\n");
    const std::string before = inv.render();

    assert(throws_code(ErrorCode::DuplicateHost, [&] { inv.add_host("web", "web1"); }));
    assert(throws_code(ErrorCode::HostNotFound, [&] { inv.remove_host("web", "web9"); }));
    assert(throws_code(ErrorCode::HostNotFound, [&] { inv.remove_host("nogroup", "web1"); }));
    assert(throws_code(ErrorCode::HostNotFound, [&] { inv.update_host("web", "web9", {{"a", "2"}}); }));
    assert(throws_code(ErrorCode::MalformedInventory, [&] { inv.add_host("web", "bad host"); }));
    assert(throws_code(ErrorCode::MalformedInventory, [&] { inv.add_host("web", "web3", {{"k", "two words"}}); }));
    assert(inv.render() == before);
    std::cout << "test_duplicate_and_missing_hosts passed" << std::endl;
}

void test_remove_and_update_host() {
    Inventory inv = Inventory::parse(
        "[web]\n"
        "web1 a=1\n"
        "# between\n"
        "web2 a=2 extra=x # comment\n"
        "[db]\n"
        "db1\n");

    inv.remove_host("web", "web1");
    inv.update_host("web", "web2", {{"a", "3"}, {"new", "y"}});

    const std::string expected =
        "[web]\n"
        "# between\n"
        "web2 a=3 extra=x new=y # comment\n"
        "[db]\n"
        "db1\n";
    assert(inv.render() == expected);
    std::cout << "test_remove_and_update_host passed" << std::endl;
}

void test_vars_and_children_sections() {
    Inventory inv = Inventory::parse("[web:vars]\nhttp_port=80\n[all:children]\nweb\n");
    const HostGroup* vars = inv.find_group("web:vars");
    assert(vars != nullptr);
    assert(vars->kind == GroupKind::Vars);
    assert(vars->find("http_port")->vars[0].second == "80");

    const HostGroup* children = inv.find_group("all:children");
    assert(children != nullptr && children->kind == GroupKind::Children);
    assert(inv.hosts().empty());

    assert(throws_code(ErrorCode::MalformedInventory, [&] { inv.add_host("web:vars", "h1"); }));
    std::cout << "test_vars_and_children_sections passed" << std::endl;
}

void test_ungrouped_hosts() {
    Inventory inv = Inventory::parse("# top\nlonely ip=1.2.3.4\n[web]\nweb1\n");
    auto groups = inv.groups();
    assert(groups.size() == 2);
    assert(groups[0] == Inventory::kUngrouped);
    assert(inv.find_host(Inventory::kUngrouped, "lonely") != nullptr);

    Inventory no_ungrouped = Inventory::parse("# only a comment\n[web]\nweb1\n");
    assert(no_ungrouped.groups().size() == 1);
    std::cout << "test_ungrouped_hosts passed" << std::endl;
}

int main() {
    test_round_trip_preserves_text();
    test_parse_groups_and_vars();
    test_malformed_lines();
    test_add_host_to_new_group();
    test_add_host_to_existing_group_keeps_other_lines();
    test_duplicate_and_missing_hosts();
    test_remove_and_update_host();
    test_vars_and_children_sections();
    test_ungrouped_hosts();

    std::cout << "All Inventory tests passed!" << std::endl;
    return 0;
}
