#include "catalog_data.h"

namespace rehearse::catalog_data {

namespace {

constexpr project_row kProjects[]{
  { "DEVEX", "Developer Experience", "Streamline Developer Experience initiatives" },
  { "TECHCON", "Technology Consolidation", "Consolidate Technology Platforms initiatives" },
  { "AIOPS", "AI Operations", "AI-Powered Operations initiatives" },
  { "GOV", "Governance & Compliance", "Automate Governance & Compliance initiatives" },
  { "DATA", "Data & Analytics", "Accelerate Data-Driven Decisions initiatives" },
};

// Depth-first: each row's parent is the nearest preceding row of the parent
// type in the same project.
constexpr hierarchy_row kHierarchy[]{
  { "DEVEX", entity_type::STRATEGIC_OBJECTIVE, "Streamline Developer Experience", "Reduce friction in the software delivery lifecycle - faster onboarding, self-service infrastructure, automated compliance gates, and unified toolchain" },
  { "DEVEX", entity_type::PORTFOLIO_EPIC, "Self-Service Infrastructure", "Enable developers to provision and manage infrastructure on-demand" },
  { "DEVEX", entity_type::BUSINESS_OUTCOME, "On-Demand Environment Provisioning", "Developers can spin up environments in minutes without tickets" },
  { "DEVEX", entity_type::FEATURE, "Infrastructure-as-Code templates", "Terraform/Pulumi templates for common architectures" },
  { "DEVEX", entity_type::FEATURE, "Environment request portal", "Self-service UI for environment provisioning" },
  { "DEVEX", entity_type::FEATURE, "Auto-teardown for idle environments", "Cost savings through automatic cleanup of unused resources" },
  { "DEVEX", entity_type::BUSINESS_OUTCOME, "Developer Cloud Workspaces", "Cloud-based development environments for consistent tooling" },
  { "DEVEX", entity_type::FEATURE, "Cloud IDE provisioning", "VS Code Server or GitHub Codespaces integration" },
  { "DEVEX", entity_type::FEATURE, "Pre-configured dev containers", "Standardized development containers per stack" },
  { "DEVEX", entity_type::FEATURE, "Secrets injection automation", "Secure secrets management for dev environments" },
  { "DEVEX", entity_type::BUSINESS_OUTCOME, "Database Self-Service", "On-demand database provisioning and data management" },
  { "DEVEX", entity_type::FEATURE, "On-demand database cloning", "Clone production databases for testing" },
  { "DEVEX", entity_type::FEATURE, "Data masking for non-prod", "Automatic PII masking in non-production environments" },
  { "DEVEX", entity_type::FEATURE, "Schema migration automation", "Automated database schema deployments" },
  { "DEVEX", entity_type::PORTFOLIO_EPIC, "Unified CI/CD Platform", "Standardized build, test, and deployment pipelines" },
  { "DEVEX", entity_type::BUSINESS_OUTCOME, "Pipeline Standardization", "Golden path CI/CD templates for all teams" },
  { "DEVEX", entity_type::FEATURE, "Golden pipeline templates", "Reusable pipeline templates for common patterns" },
  { "DEVEX", entity_type::FEATURE, "Build time optimization", "Caching, parallelization, and incremental builds" },
  { "DEVEX", entity_type::FEATURE, "Artifact management consolidation", "Single artifact repository (Nexus/Artifactory)" },
  { "DEVEX", entity_type::BUSINESS_OUTCOME, "Automated Quality Gates", "Shift-left quality enforcement in pipelines" },
  { "DEVEX", entity_type::FEATURE, "SAST/DAST integration", "Security scanning in CI pipelines" },
  { "DEVEX", entity_type::FEATURE, "Test coverage enforcement", "Minimum coverage thresholds per project" },
  { "DEVEX", entity_type::FEATURE, "Performance regression detection", "Automated performance benchmarking" },
  { "DEVEX", entity_type::BUSINESS_OUTCOME, "Progressive Delivery", "Safe rollout strategies for deployments" },
  { "DEVEX", entity_type::FEATURE, "Feature flag platform", "LaunchDarkly/Split integration for feature toggles" },
  { "DEVEX", entity_type::FEATURE, "Canary deployment automation", "Gradual rollout with automatic rollback" },
  { "DEVEX", entity_type::FEATURE, "Rollback automation", "One-click rollback for failed deployments" },
  { "DEVEX", entity_type::PORTFOLIO_EPIC, "Developer Onboarding & Enablement", "Fast-track new developers to productivity" },
  { "DEVEX", entity_type::BUSINESS_OUTCOME, "Day-1 Productivity", "New developers productive within first day" },
  { "DEVEX", entity_type::FEATURE, "Automated access provisioning", "JIT access to required systems on hire" },
  { "DEVEX", entity_type::FEATURE, "Onboarding checklist automation", "Guided setup with progress tracking" },
  { "DEVEX", entity_type::FEATURE, "Starter project templates", "Cookiecutter templates for new services" },
  { "DEVEX", entity_type::BUSINESS_OUTCOME, "Inner Source Program", "Foster code reuse and collaboration across teams" },
  { "DEVEX", entity_type::FEATURE, "Internal package registry", "Private npm/PyPI for shared libraries" },
  { "DEVEX", entity_type::FEATURE, "Shared component library", "UI component library for frontend consistency" },
  { "DEVEX", entity_type::FEATURE, "Contribution guidelines & tooling", "PR templates, code owners, review automation" },
  { "TECHCON", entity_type::STRATEGIC_OBJECTIVE, "Consolidate Technology Platforms", "Reduce tech sprawl by rationalizing redundant systems, standardizing on strategic platforms, and eliminating shadow IT" },
  { "TECHCON", entity_type::PORTFOLIO_EPIC, "Application Rationalization", "Reduce application portfolio complexity" },
  { "TECHCON", entity_type::BUSINESS_OUTCOME, "Portfolio Assessment", "Complete visibility into application landscape" },
  { "TECHCON", entity_type::FEATURE, "Application inventory discovery", "Automated discovery of all applications" },
  { "TECHCON", entity_type::FEATURE, "TCO analysis tooling", "Total cost of ownership calculator" },
  { "TECHCON", entity_type::FEATURE, "Redundancy identification", "Find duplicate/overlapping applications" },
  { "TECHCON", entity_type::BUSINESS_OUTCOME, "Sunset Legacy Systems", "Retire end-of-life applications" },
  { "TECHCON", entity_type::FEATURE, "Decommission roadmap planning", "Phased retirement schedules" },
  { "TECHCON", entity_type::FEATURE, "Data migration execution", "Safe data extraction and archival" },
  { "TECHCON", entity_type::FEATURE, "Consumer cutover coordination", "Stakeholder communication and transition" },
  { "TECHCON", entity_type::BUSINESS_OUTCOME, "Build vs Buy Framework", "Decision framework for new capabilities" },
  { "TECHCON", entity_type::FEATURE, "Vendor evaluation criteria", "Standardized RFP scoring matrix" },
  { "TECHCON", entity_type::FEATURE, "Total cost modeling", "5-year TCO comparison templates" },
  { "TECHCON", entity_type::FEATURE, "Strategic vendor partnerships", "Preferred vendor program" },
  { "TECHCON", entity_type::PORTFOLIO_EPIC, "Infrastructure Standardization", "Converge on strategic infrastructure platforms" },
  { "TECHCON", entity_type::BUSINESS_OUTCOME, "Cloud Landing Zone", "Standardized cloud foundation" },
  { "TECHCON", entity_type::FEATURE, "Account/subscription structure", "Multi-account strategy with guardrails" },
  { "TECHCON", entity_type::FEATURE, "Network topology standards", "Hub-spoke network architecture" },
  { "TECHCON", entity_type::FEATURE, "Tagging & cost allocation", "Mandatory tagging for cost attribution" },
  { "TECHCON", entity_type::BUSINESS_OUTCOME, "Container Platform Consolidation", "Single Kubernetes platform" },
  { "TECHCON", entity_type::FEATURE, "Kubernetes cluster standards", "EKS/AKS/GKE configuration baseline" },
  { "TECHCON", entity_type::FEATURE, "Service mesh adoption", "Istio/Linkerd for service-to-service" },
  { "TECHCON", entity_type::FEATURE, "Image registry consolidation", "Single container registry with scanning" },
  { "TECHCON", entity_type::BUSINESS_OUTCOME, "Database Platform Reduction", "Reduce database engine sprawl" },
  { "TECHCON", entity_type::FEATURE, "Strategic DB engine selection", "PostgreSQL, MongoDB, Redis as standards" },
  { "TECHCON", entity_type::FEATURE, "Migration path tooling", "Database migration automation" },
  { "TECHCON", entity_type::FEATURE, "DBA self-service portal", "Self-service database provisioning" },
  { "TECHCON", entity_type::PORTFOLIO_EPIC, "Toolchain Consolidation", "Reduce tool sprawl across SDLC" },
  { "TECHCON", entity_type::BUSINESS_OUTCOME, "ITSM Unification", "Single IT Service Management platform" },
  { "TECHCON", entity_type::FEATURE, "ServiceNow single instance", "Consolidate to one SNOW instance" },
  { "TECHCON", entity_type::FEATURE, "CMDB data quality program", "Automated CMDB reconciliation" },
  { "TECHCON", entity_type::FEATURE, "Workflow standardization", "Common change/incident workflows" },
  { "TECHCON", entity_type::BUSINESS_OUTCOME, "Observability Stack Convergence", "Unified monitoring and logging" },
  { "TECHCON", entity_type::FEATURE, "Monitoring tool reduction", "Converge from 5+ tools to 1-2" },
  { "TECHCON", entity_type::FEATURE, "Single pane of glass dashboard", "Unified operations dashboard" },
  { "TECHCON", entity_type::FEATURE, "Alert routing consolidation", "Single alert management system" },
  { "AIOPS", entity_type::STRATEGIC_OBJECTIVE, "AI-Powered Operations", "Embed AI/ML into operational processes - predictive incident detection, automated remediation, intelligent capacity planning, and AIOps" },
  { "AIOPS", entity_type::PORTFOLIO_EPIC, "Predictive Incident Management", "Detect and prevent incidents before impact" },
  { "AIOPS", entity_type::BUSINESS_OUTCOME, "Anomaly Detection", "ML-based detection of abnormal patterns" },
  { "AIOPS", entity_type::FEATURE, "ML-based threshold tuning", "Dynamic thresholds based on patterns" },
  { "AIOPS", entity_type::FEATURE, "Log pattern recognition", "NLP for log anomaly detection" },
  { "AIOPS", entity_type::FEATURE, "Metric correlation engine", "Cross-metric anomaly correlation" },
  { "AIOPS", entity_type::BUSINESS_OUTCOME, "Predictive Alerting", "Alert before failures occur" },
  { "AIOPS", entity_type::FEATURE, "Failure prediction models", "Time-series forecasting for failures" },
  { "AIOPS", entity_type::FEATURE, "Alert noise reduction", "ML-based alert deduplication" },
  { "AIOPS", entity_type::FEATURE, "Incident probability scoring", "Risk scores for potential incidents" },
  { "AIOPS", entity_type::BUSINESS_OUTCOME, "Root Cause Analysis Automation", "Accelerate incident diagnosis" },
  { "AIOPS", entity_type::FEATURE, "Topology-aware diagnostics", "Service map-based root cause" },
  { "AIOPS", entity_type::FEATURE, "Change correlation analysis", "Link incidents to recent changes" },
  { "AIOPS", entity_type::FEATURE, "Suggested remediation engine", "AI-recommended fix actions" },
  { "AIOPS", entity_type::PORTFOLIO_EPIC, "Intelligent Automation", "AI-driven operational automation" },
  { "AIOPS", entity_type::BUSINESS_OUTCOME, "Auto-Remediation", "Self-healing infrastructure" },
  { "AIOPS", entity_type::FEATURE, "Runbook automation library", "Codified remediation procedures" },
  { "AIOPS", entity_type::FEATURE, "Self-healing infrastructure", "Automatic recovery actions" },
  { "AIOPS", entity_type::FEATURE, "Automated rollback triggers", "ML-triggered deployment rollbacks" },
  { "AIOPS", entity_type::BUSINESS_OUTCOME, "Capacity Intelligence", "Smart resource management" },
  { "AIOPS", entity_type::FEATURE, "Demand forecasting models", "Predict capacity needs" },
  { "AIOPS", entity_type::FEATURE, "Auto-scaling optimization", "ML-tuned scaling policies" },
  { "AIOPS", entity_type::FEATURE, "Cost anomaly detection", "Alert on unexpected spend" },
  { "AIOPS", entity_type::BUSINESS_OUTCOME, "ChatOps & Virtual SRE", "Conversational operations" },
  { "AIOPS", entity_type::FEATURE, "Slack/Teams bot integration", "ChatOps command interface" },
  { "AIOPS", entity_type::FEATURE, "Natural language incident queries", "Ask questions about incidents" },
  { "AIOPS", entity_type::FEATURE, "Automated status communications", "AI-generated status updates" },
  { "AIOPS", entity_type::PORTFOLIO_EPIC, "Knowledge & Learning Systems", "Capture and leverage operational knowledge" },
  { "AIOPS", entity_type::BUSINESS_OUTCOME, "Operational Knowledge Base", "Centralized ops knowledge" },
  { "AIOPS", entity_type::FEATURE, "Incident pattern library", "Searchable incident history" },
  { "AIOPS", entity_type::FEATURE, "Auto-generated runbooks", "ML-suggested procedures" },
  { "AIOPS", entity_type::FEATURE, "Tribal knowledge capture", "Document expert knowledge" },
  { "AIOPS", entity_type::BUSINESS_OUTCOME, "Continuous Learning Pipeline", "Models that improve over time" },
  { "AIOPS", entity_type::FEATURE, "Model retraining automation", "Scheduled model updates" },
  { "AIOPS", entity_type::FEATURE, "Feedback loop integration", "Operator feedback for learning" },
  { "AIOPS", entity_type::FEATURE, "Drift detection & alerting", "Detect model degradation" },
  { "GOV", entity_type::STRATEGIC_OBJECTIVE, "Automate Governance & Compliance", "Shift compliance left with policy-as-code, automated evidence collection, and continuous control monitoring - eliminate manual audit burden" },
  { "GOV", entity_type::PORTFOLIO_EPIC, "Policy-as-Code Platform", "Codified governance policies" },
  { "GOV", entity_type::BUSINESS_OUTCOME, "Preventive Controls", "Block non-compliant changes before deployment" },
  { "GOV", entity_type::FEATURE, "OPA/Rego policy library", "Reusable policy definitions" },
  { "GOV", entity_type::FEATURE, "Pre-commit policy hooks", "Developer-time policy checks" },
  { "GOV", entity_type::FEATURE, "Infrastructure policy scanning", "IaC compliance validation" },
  { "GOV", entity_type::BUSINESS_OUTCOME, "Deployment Governance Gates", "Risk-based deployment approval" },
  { "GOV", entity_type::FEATURE, "Risk-based gate automation", "Auto-approve low-risk changes" },
  { "GOV", entity_type::FEATURE, "Approval workflow engine", "Configurable approval chains" },
  { "GOV", entity_type::FEATURE, "Environment promotion rules", "Stage-gate requirements" },
  { "GOV", entity_type::BUSINESS_OUTCOME, "Policy Drift Detection", "Continuous compliance monitoring" },
  { "GOV", entity_type::FEATURE, "Continuous compliance scanning", "24/7 policy violation detection" },
  { "GOV", entity_type::FEATURE, "Auto-remediation workflows", "Automatic drift correction" },
  { "GOV", entity_type::FEATURE, "Exception management portal", "Managed policy exceptions" },
  { "GOV", entity_type::PORTFOLIO_EPIC, "Evidence Automation", "Automated compliance evidence lifecycle" },
  { "GOV", entity_type::BUSINESS_OUTCOME, "Continuous Evidence Collection", "Always audit-ready" },
  { "GOV", entity_type::FEATURE, "Control-to-evidence mapping", "Link controls to evidence sources" },
  { "GOV", entity_type::FEATURE, "API-based evidence capture", "Automated evidence pull from tools" },
  { "GOV", entity_type::FEATURE, "Immutable evidence repository", "Tamper-proof evidence storage" },
  { "GOV", entity_type::BUSINESS_OUTCOME, "Audit-Ready Reporting", "On-demand compliance reports" },
  { "GOV", entity_type::FEATURE, "SOX control dashboards", "Real-time SOX compliance view" },
  { "GOV", entity_type::FEATURE, "PCI-DSS report automation", "Auto-generated PCI reports" },
  { "GOV", entity_type::FEATURE, "On-demand auditor access", "Self-service auditor portal" },
  { "GOV", entity_type::BUSINESS_OUTCOME, "Evidence Lifecycle Management", "Track evidence freshness" },
  { "GOV", entity_type::FEATURE, "TTL-based expiry tracking", "Evidence expiration alerts" },
  { "GOV", entity_type::FEATURE, "Renewal notification workflows", "Proactive renewal reminders" },
  { "GOV", entity_type::FEATURE, "Historical evidence archive", "Long-term evidence retention" },
  { "GOV", entity_type::PORTFOLIO_EPIC, "Risk & Control Management", "Enterprise risk visibility" },
  { "GOV", entity_type::BUSINESS_OUTCOME, "Control Framework Automation", "Dynamic control requirements" },
  { "GOV", entity_type::FEATURE, "Control requirement engine", "Risk-based control calculation" },
  { "GOV", entity_type::FEATURE, "Risk profile questionnaire", "Self-service risk assessment" },
  { "GOV", entity_type::FEATURE, "Guild-based control ownership", "Clear control accountability" },
  { "GOV", entity_type::BUSINESS_OUTCOME, "Risk Visibility & Escalation", "Enterprise risk transparency" },
  { "GOV", entity_type::FEATURE, "Risk materiality scoring", "Quantified risk assessment" },
  { "GOV", entity_type::FEATURE, "Constraint tracking workflows", "Jira-based constraint management" },
  { "GOV", entity_type::FEATURE, "Executive risk dashboards", "Board-level risk reporting" },
  { "DATA", entity_type::STRATEGIC_OBJECTIVE, "Accelerate Data-Driven Decisions", "Democratize data access with self-service analytics, real-time dashboards, and embedded ML insights across business functions" },
  { "DATA", entity_type::PORTFOLIO_EPIC, "Enterprise Data Platform", "Unified data foundation" },
  { "DATA", entity_type::BUSINESS_OUTCOME, "Unified Data Lake", "Single source of truth for analytics" },
  { "DATA", entity_type::FEATURE, "Lakehouse architecture", "Delta Lake/Iceberg implementation" },
  { "DATA", entity_type::FEATURE, "Real-time ingestion pipelines", "Streaming data integration" },
  { "DATA", entity_type::FEATURE, "Data quality framework", "Automated data validation" },
  { "DATA", entity_type::BUSINESS_OUTCOME, "Data Catalog & Discovery", "Find and understand data assets" },
  { "DATA", entity_type::FEATURE, "Metadata harvesting automation", "Auto-catalog new datasets" },
  { "DATA", entity_type::FEATURE, "Business glossary management", "Common business definitions" },
  { "DATA", entity_type::FEATURE, "Data lineage visualization", "End-to-end data flow tracking" },
  { "DATA", entity_type::BUSINESS_OUTCOME, "Data Mesh Enablement", "Decentralized data ownership" },
  { "DATA", entity_type::FEATURE, "Domain ownership model", "Domain-oriented data teams" },
  { "DATA", entity_type::FEATURE, "Data product templates", "Standardized data product creation" },
  { "DATA", entity_type::FEATURE, "Federated governance", "Centralized standards, local execution" },
  { "DATA", entity_type::PORTFOLIO_EPIC, "Self-Service Analytics", "Empower business users with data" },
  { "DATA", entity_type::BUSINESS_OUTCOME, "Democratized Reporting", "Anyone can build reports" },
  { "DATA", entity_type::FEATURE, "Semantic layer", "Business-friendly metrics store" },
  { "DATA", entity_type::FEATURE, "Self-service dashboard builder", "Drag-and-drop report creation" },
  { "DATA", entity_type::FEATURE, "Natural language queries", "Ask questions in plain English" },
  { "DATA", entity_type::BUSINESS_OUTCOME, "Real-Time Insights", "Live operational intelligence" },
  { "DATA", entity_type::FEATURE, "Streaming analytics platform", "Real-time event processing" },
  { "DATA", entity_type::FEATURE, "Live operational dashboards", "Sub-second dashboard refresh" },
  { "DATA", entity_type::FEATURE, "Alert-driven insights", "Proactive anomaly notifications" },
  { "DATA", entity_type::BUSINESS_OUTCOME, "Embedded Analytics", "Analytics in applications" },
  { "DATA", entity_type::FEATURE, "Application-embedded charts", "In-app visualizations" },
  { "DATA", entity_type::FEATURE, "API-first analytics", "Analytics as a service" },
  { "DATA", entity_type::FEATURE, "White-label reporting", "Customer-facing analytics" },
  { "DATA", entity_type::PORTFOLIO_EPIC, "ML Democratization", "Make ML accessible to all" },
  { "DATA", entity_type::BUSINESS_OUTCOME, "Citizen Data Science", "Non-experts can build models" },
  { "DATA", entity_type::FEATURE, "AutoML platform", "Automated model training" },
  { "DATA", entity_type::FEATURE, "No-code model builder", "Visual ML pipeline creation" },
  { "DATA", entity_type::FEATURE, "Model marketplace", "Pre-built model catalog" },
  { "DATA", entity_type::BUSINESS_OUTCOME, "Production ML Platform", "Enterprise MLOps" },
  { "DATA", entity_type::FEATURE, "Feature store", "Centralized feature management" },
  { "DATA", entity_type::FEATURE, "Model registry & versioning", "Model lifecycle management" },
  { "DATA", entity_type::FEATURE, "A/B testing infrastructure", "Model experimentation platform" },
};

constexpr constraint_row kConstraints[]{
  { "DEVEX", "WAF rules must be configured before production deployment", "Web Application Firewall rules are required for all internet-facing services to protect against OWASP Top 10 vulnerabilities.", "Security", "Critical", "Configure WAF rules in CloudFlare/AWS WAF. Rules must cover SQL injection, XSS, and path traversal. Security team to validate configuration.", "Identified", entity_type::BUSINESS_OUTCOME, "On-Demand Environment Provisioning" },
  { "DEVEX", "Penetration testing must be completed for new APIs", "All externally exposed APIs require penetration testing before production release.", "Security", "High", "Engage security team for pen test. Estimated 2-week engagement. All critical/high findings must be remediated before go-live.", "In Progress", entity_type::FEATURE, "Environment request portal" },
  { "DEVEX", "Secrets rotation policy must be implemented", "All secrets and API keys must have automated rotation with maximum 90-day lifetime.", "Security", "High", "Integrate with HashiCorp Vault for dynamic secrets. Configure rotation schedule for all credentials.", "Identified", entity_type::FEATURE, "Secrets injection automation" },
  { "TECHCON", "Zero trust network policies required", "Service-to-service communication must use mTLS and explicit network policies.", "Security", "Critical", "Implement Istio service mesh with strict mTLS. Define NetworkPolicies for all Kubernetes namespaces.", "Identified", entity_type::FEATURE, "Service mesh adoption" },
  { "DEVEX", "PII encryption must be enabled for all customer data", "All personally identifiable information must be encrypted at rest and in transit per GDPR requirements.", "Data", "Critical", "Enable TDE for databases. Implement field-level encryption for PII columns. Update data classification tags.", "In Progress", entity_type::FEATURE, "Data masking for non-prod" },
  { "DATA", "Data retention policy must be documented and enforced", "All data stores must have documented retention policies with automated purge procedures.", "Data", "High", "Define retention periods per data classification. Implement lifecycle policies in S3/database. Create audit trail for deletions.", "Identified", entity_type::BUSINESS_OUTCOME, "Unified Data Lake" },
  { "DATA", "Data lineage must be captured for regulatory reporting", "End-to-end data lineage required for all data used in financial and regulatory reports.", "Data", "High", "Integrate OpenLineage with data pipelines. Configure automatic lineage capture in Spark/Airflow jobs.", "Identified", entity_type::FEATURE, "Data lineage visualization" },
  { "GOV", "GDPR right-to-deletion workflow required", "Must support automated data subject deletion requests within 30-day SLA.", "Data", "Critical", "Build deletion workflow in ServiceNow. Create data discovery scripts for all data stores. Test deletion completeness.", "Ready for Review", entity_type::FEATURE, "Exception management portal" },
  { "AIOPS", "Runbook documentation required for incident response", "All production services must have runbooks covering common failure scenarios and recovery procedures.", "Operations", "Medium", "Create runbook templates. Document top 10 incident scenarios per service. Link runbooks to PagerDuty alerts.", "In Progress", entity_type::FEATURE, "Runbook automation library" },
  { "AIOPS", "DR failover must be tested quarterly", "Disaster recovery procedures must be validated through quarterly failover tests.", "Operations", "High", "Schedule Q1 DR test. Define success criteria (RTO < 4hr, RPO < 1hr). Document lessons learned.", "Identified", entity_type::BUSINESS_OUTCOME, "Auto-Remediation" },
  { "TECHCON", "SLOs must be defined and monitored", "All Tier 1 services must have defined SLOs with automated alerting on budget burn.", "Operations", "Medium", "Define availability and latency SLOs. Configure SLO dashboards in Grafana. Set up burn-rate alerts.", "In Progress", entity_type::FEATURE, "Single pane of glass dashboard" },
  { "AIOPS", "Capacity planning review required before launch", "Load testing and capacity analysis must be completed for expected peak traffic.", "Operations", "High", "Run load tests at 2x expected peak. Document resource requirements. Configure auto-scaling policies.", "Identified", entity_type::FEATURE, "Demand forecasting models" },
  { "DEVEX", "Architecture review required for new service", "All new services must pass EA review board for alignment with strategic patterns.", "Enterprise Architecture", "Medium", "Submit ADR to EA review board. Address feedback on technology choices. Update architecture diagrams.", "In Progress", entity_type::BUSINESS_OUTCOME, "Pipeline Standardization" },
  { "TECHCON", "API versioning strategy must follow standards", "All APIs must implement semantic versioning with backward compatibility guarantees.", "Enterprise Architecture", "Medium", "Implement URL-based versioning (v1, v2). Document deprecation policy. Add version headers to responses.", "Ready for Review", entity_type::FEATURE, "Strategic DB engine selection" },
  { "DATA", "Technology stack must be on approved list", "All technology choices must be from the approved technology radar.", "Enterprise Architecture", "Low", "Review tech choices against radar. Submit exception request for any non-standard technologies.", "Identified", entity_type::FEATURE, "Lakehouse architecture" },
  { "DATA", "Integration patterns must use event-driven architecture", "New integrations should prefer async event-driven patterns over synchronous API calls.", "Enterprise Architecture", "Medium", "Design event schema. Set up Kafka topics. Implement consumer groups with proper error handling.", "Identified", entity_type::FEATURE, "Real-time ingestion pipelines" },
  { "GOV", "Production deployment requires change approval", "All production deployments must have approved change request with rollback plan.", "Operations", "High", "Create CR in ServiceNow. Document deployment steps and rollback procedure. Get CAB approval.", "Identified", entity_type::BUSINESS_OUTCOME, "Deployment Governance Gates" },
  { "GOV", "Compliance evidence must be collected before release", "SOX-relevant applications must have compliance evidence uploaded before production deployment.", "Security", "Critical", "Complete control attestations. Upload evidence to GRC portal. Get compliance officer sign-off.", "In Progress", entity_type::BUSINESS_OUTCOME, "Continuous Evidence Collection" },
};

constexpr version_row kVersions[]{
  { "v1.0.0", "Initial release", true },
  { "v1.1.0", "Bug fixes and improvements", true },
  { "v2.0.0", "Current development sprint", false },
  { "v2.1.0", "Next planned release", false },
  { "v3.0.0", "Future major release", false },
};

}  // namespace

std::span<project_row const> projects() { return kProjects; }
std::span<hierarchy_row const> hierarchy() { return kHierarchy; }
std::span<constraint_row const> constraints() { return kConstraints; }
std::span<version_row const> versions() { return kVersions; }

}  // namespace rehearse::catalog_data
